#pragma once

#include <drydock/util/env.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drydock {

/**
 * @brief How to decide that a started service is able to accept work. Polling is always bounded
 * by both `max_attempts` and `budget`.
 */
struct readiness_probe {
    /// Shell command that exits zero once the service is ready. If unset, the service is ready as
    /// soon as its start command succeeds.
    std::optional<std::string> command;

    std::chrono::milliseconds interval     = std::chrono::seconds(1);
    std::chrono::milliseconds budget       = std::chrono::seconds(60);
    int                       max_attempts = 60;

    /// Limit on a single run of `command`
    std::chrono::milliseconds attempt_timeout = std::chrono::seconds(10);
};

/**
 * @brief A service run from a container image with the container runtime CLI. Expands to
 * `<runtime> run --name <service> -e K=V... -p P... [args...] -d <image> [command...]` and
 * `<runtime> rm -f <service>`.
 */
struct container_image {
    std::string              image;
    std::vector<std::string> ports;
    /// Additional arguments for `<runtime> run`, placed before the image name
    std::vector<std::string> run_args;
    /// Command and arguments given to the container, placed after the image name
    std::vector<std::string> command;
};

/**
 * @brief An ephemeral external process the tests need, such as a database.
 */
struct service_spec {
    std::string name;

    /// Shell command that starts the service. Foreground commands must exit zero; background
    /// commands are kept running until teardown.
    std::optional<std::string> start;
    /// Shell command that removes the service
    std::optional<std::string> stop;

    std::optional<container_image> image;

    readiness_probe ready;

    env_map                              env;
    std::optional<std::filesystem::path> cwd;

    /// Keep the start command running in the background for the lifetime of the service
    bool background = false;

    /// Run the stop command (ignoring failure) before starting, to remove a leftover instance
    bool cleanup_before_start = false;
};

struct e_service_name {
    std::string value;
};

struct e_readiness_attempts {
    int                       attempts;
    std::chrono::milliseconds elapsed;
};

}  // namespace drydock
