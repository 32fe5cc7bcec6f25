#pragma once

#include "./service.hpp"

#include <chrono>
#include <optional>

namespace drydock {

struct pipeline_context;

/**
 * @brief The collaborator that actually creates and destroys services.
 */
class service_runtime {
public:
    virtual ~service_runtime() = default;

    /**
     * @brief Start the service. Returns once the start command has completed (or, for a background
     * service, has been spawned). Throws service_start_error on failure.
     */
    virtual void start(const service_spec&, const pipeline_context&) = 0;

    /**
     * @brief Run a single readiness check. Returns `true` if the service is ready.
     *
     * Throws service_start_error if the service can never become ready, e.g. its process died.
     */
    virtual bool probe(const service_spec&, const pipeline_context&, std::chrono::milliseconds timeout)
        = 0;

    /**
     * @brief Remove the service. Called for every service that was started, whether or not it
     * became ready. Throws teardown_error on failure.
     */
    virtual void stop(const service_spec&, const pipeline_context&) = 0;
};

}  // namespace drydock
