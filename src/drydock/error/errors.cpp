#include "./errors.hpp"

#include <neo/utility.hpp>

using namespace drydock;

namespace {

std::string error_doc_prefix = "docs/err/";

std::string error_doc_suffix(drydock::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_config:
        return "invalid-config.md";
    case errc::unknown_target:
    case errc::unknown_pipeline:
    case errc::unknown_suite:
    case errc::unknown_service:
        return "unknown-name.md";
    case errc::duplicate_target:
    case errc::duplicate_output:
        return "duplicate-declaration.md";
    case errc::dependency_cycle:
        return "dependency-cycle.md";
    case errc::missing_input:
        return "missing-input.md";
    case errc::action_failed:
        return "action-failed.md";
    case errc::clean_failure:
        return "clean-failure.md";
    case errc::service_start_failed:
        return "service-start-failed.md";
    case errc::readiness_timeout:
        return "readiness-timeout.md";
    case errc::teardown_failed:
        return "teardown-failed.md";
    case errc::service_name_collision:
        return "service-name-collision.md";
    case errc::consumer_failed:
        return "test-failure.md";
    case errc::missing_required_env:
        return "missing-required-env.md";
    case errc::deadline_exceeded:
        return "deadline-exceeded.md";
    case errc::none:
        break;
    }
    neo::unreachable();
}

}  // namespace

std::string drydock::error_reference_of(drydock::errc ec) noexcept {
    return error_doc_prefix + error_doc_suffix(ec);
}

std::string_view drydock::explanation_of(drydock::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_config:
        return R"(
The project manifest (drydock.yaml) is malformed. Refer to the error message
above for the offending key or value.
)";
    case errc::unknown_target:
        return R"(
A build target was requested (on the command line, in a pipeline stage, or as
the 'deps' of another target) that is not declared in the manifest.
)";
    case errc::unknown_pipeline:
        return R"(The requested pipeline is not declared in the manifest's 'pipelines' table.)";
    case errc::unknown_suite:
        return R"(The requested test suite is not declared in the manifest's 'suites' table.)";
    case errc::unknown_service:
        return R"(
A test suite lists a service that is not declared in the manifest's 'services'
table.
)";
    case errc::duplicate_target:
        return R"(Target names must be unique within a manifest.)";
    case errc::duplicate_output:
        return R"(
Two targets declare the same output file. Each output must be produced by
exactly one target, otherwise drydock cannot decide which action to run when
the file is stale.
)";
    case errc::dependency_cycle:
        return R"(
The targets form a dependency cycle, either through 'deps' or through an input
that is the output of another target. No action was executed. Break the cycle
in the manifest.
)";
    case errc::missing_input:
        return R"(
A target lists an input file that does not exist and that no other target
produces. Create the file, fix the path, or declare the target that generates
it.
)";
    case errc::action_failed:
        return R"(
A build action exited with a non-zero status. Later targets in the plan were
not attempted. Refer to the output of the failing command above.
)";
    case errc::clean_failure:
        return R"(A path listed for cleaning could not be removed.)";
    case errc::service_start_failed:
        return R"(
A service's start command failed (or a background service exited before it
became ready). Any services that had been started were torn down.
)";
    case errc::readiness_timeout:
        return R"(
A service did not pass its readiness check within its wait budget. Readiness
polling is always bounded. The service and every previously started service
were torn down, and the tests were not run.
)";
    case errc::teardown_failed:
        return R"(
A service could not be torn down cleanly. This never replaces an earlier
failure, but the service may need to be removed by hand.
)";
    case errc::service_name_collision:
        return R"(
A service with the same name is already provisioned, either earlier in this
run or by another drydock process using the same state directory.
)";
    case errc::consumer_failed:
        return R"(
The test command exited with a non-zero status. The failing output is above.
All services were torn down.
)";
    case errc::missing_required_env:
        return R"(
The test suite requires an environment variable that is not set. Set it in the
environment or in the manifest's 'env' table.
)";
    case errc::deadline_exceeded:
        return R"(
The pipeline ran past its deadline. Started services were torn down before
drydock exited.
)";
    case errc::none:
        break;
    }
    neo::unreachable();
}

std::string_view drydock::default_error_string(drydock::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_config:
        return "Invalid project manifest";
    case errc::unknown_target:
        return "Unknown target";
    case errc::unknown_pipeline:
        return "Unknown pipeline";
    case errc::unknown_suite:
        return "Unknown test suite";
    case errc::unknown_service:
        return "Unknown service";
    case errc::duplicate_target:
        return "Duplicate target name";
    case errc::duplicate_output:
        return "An output is declared by more than one target";
    case errc::dependency_cycle:
        return "Dependency cycle between targets";
    case errc::missing_input:
        return "A target input does not exist";
    case errc::action_failed:
        return "A build action failed";
    case errc::clean_failure:
        return "Failed to clean a path";
    case errc::service_start_failed:
        return "A service failed to start";
    case errc::readiness_timeout:
        return "A service did not become ready in time";
    case errc::teardown_failed:
        return "A service failed to tear down";
    case errc::service_name_collision:
        return "A service with that name is already provisioned";
    case errc::consumer_failed:
        return "Tests failed";
    case errc::missing_required_env:
        return "A required environment variable is not set";
    case errc::deadline_exceeded:
        return "The pipeline deadline was exceeded";
    case errc::none:
        break;
    }
    neo::unreachable();
}
