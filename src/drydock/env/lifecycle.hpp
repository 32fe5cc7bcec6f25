#pragma once

#include "./runtime.hpp"
#include "./service.hpp"

#include <functional>
#include <vector>

namespace drydock {

struct pipeline_context;

/**
 * @brief Provision the given services, run `consumer`, then tear the services down.
 *
 * Services are started in order, each one ready before the next starts. `consumer` is invoked
 * exactly once, and only if every service became ready. Every service that was started is torn
 * down, in reverse order, however this function exits. A teardown failure is logged and never
 * replaces an error from startup or from the consumer.
 *
 * Throws service_name_collision_error, before anything is started, if two specs share a name, if a
 * name is already active in `ctx`, or if another drydock process holds the service's lock file.
 */
void with_services(pipeline_context&                ctx,
                   service_runtime&                 runtime,
                   const std::vector<service_spec>& specs,
                   const std::function<void()>&     consumer);

/**
 * @brief Poll the readiness check of a started service until it passes.
 *
 * Throws readiness_timeout_error once the attempts or the wait budget are used up, or
 * deadline_exceeded_error if the pipeline deadline is what ran out. Returns the number of checks
 * that were run.
 */
int wait_until_ready(const pipeline_context& ctx, service_runtime& runtime, const service_spec&);

}  // namespace drydock
