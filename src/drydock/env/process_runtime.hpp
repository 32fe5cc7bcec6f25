#pragma once

#include "./runtime.hpp"

#include <drydock/util/proc.hpp>

#include <map>
#include <string>
#include <vector>

namespace drydock {

/**
 * @brief The container runtime command prefix: DRYDOCK_CONTAINER_RUNTIME split as a shell string,
 * or `docker`.
 */
std::vector<std::string> default_container_cli();

/// The command that starts a container for an image-based service
std::vector<std::string> container_run_command(const std::vector<std::string>& cli,
                                               const service_spec&             spec);

/// The command that force-removes the container of an image-based service
std::vector<std::string> container_rm_command(const std::vector<std::string>& cli,
                                              const service_spec&             spec);

/**
 * @brief Runs services as subprocesses (including container runtime commands).
 */
class process_runtime : public service_runtime {
    std::vector<std::string>             _container_cli;
    std::map<std::string, child_process> _background;

    std::optional<std::vector<std::string>> _start_command(const service_spec&) const;
    std::optional<std::vector<std::string>> _stop_command(const service_spec&) const;
    proc_options _options_for(const service_spec&, const pipeline_context&) const;

public:
    process_runtime()
        : process_runtime(default_container_cli()) {}

    explicit process_runtime(std::vector<std::string> container_cli)
        : _container_cli(std::move(container_cli)) {}

    void start(const service_spec&, const pipeline_context&) override;
    bool probe(const service_spec&, const pipeline_context&, std::chrono::milliseconds) override;
    void stop(const service_spec&, const pipeline_context&) override;
};

}  // namespace drydock
