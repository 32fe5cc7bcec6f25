#pragma once

#include <drydock/graph/executor.hpp>

#include <string>
#include <vector>

namespace drydock {

struct pipeline_context;
class service_runtime;
class project;
struct test_suite;

struct e_suite_name {
    std::string value;
};

struct e_missing_env_vars {
    std::vector<std::string> names;
};

/**
 * @brief Run a test suite: check its required environment, provision its services, then run its
 * setup and test commands against them.
 *
 * Throws missing_required_env_error before anything starts if a required variable is unset, and
 * consumer_failure if a setup or test command fails. Services are torn down before this returns,
 * however it exits. The result covers the whole run, services included.
 */
execution_result run_suite(pipeline_context& ctx,
               service_runtime&  runtime,
               const project&    proj,
               const test_suite& suite);

}  // namespace drydock
