#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace drydock {

enum class errc {
    none = 0,

    invalid_config,
    unknown_target,
    unknown_pipeline,
    unknown_suite,
    unknown_service,
    duplicate_target,
    duplicate_output,
    dependency_cycle,
    missing_input,

    action_failed,
    clean_failure,

    service_start_failed,
    readiness_timeout,
    teardown_failed,
    service_name_collision,

    consumer_failed,
    missing_required_env,
    deadline_exceeded,
};

std::string      error_reference_of(errc) noexcept;
std::string_view explanation_of(errc) noexcept;
std::string_view default_error_string(errc) noexcept;

struct exception_base : std::runtime_error {
    using runtime_error::runtime_error;
};

struct error_base : exception_base {
    using exception_base::exception_base;

    virtual errc     get_errc() const noexcept = 0;
    std::string      error_reference() const noexcept { return error_reference_of(get_errc()); }
    std::string_view explanation() const noexcept { return explanation_of(get_errc()); }
};

/**
 * @brief Errors caused by the project manifest or by how drydock was invoked
 */
struct user_error_base : error_base {
    using error_base::error_base;
};

/**
 * @brief Errors reported by an external collaborator (an action, a service, a test command)
 */
struct external_error_base : error_base {
    using error_base::error_base;
};

template <errc ErrorCode>
struct user_error : user_error_base {
    using user_error_base::user_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode>
struct external_error : external_error_base {
    using external_error_base::external_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

using invalid_config_error         = user_error<errc::invalid_config>;
using unknown_target_error         = user_error<errc::unknown_target>;
using unknown_pipeline_error       = user_error<errc::unknown_pipeline>;
using unknown_suite_error          = user_error<errc::unknown_suite>;
using unknown_service_error        = user_error<errc::unknown_service>;
using duplicate_target_error       = user_error<errc::duplicate_target>;
using duplicate_output_error       = user_error<errc::duplicate_output>;
using dependency_cycle_error       = user_error<errc::dependency_cycle>;
using missing_input_error          = user_error<errc::missing_input>;
using missing_required_env_error   = user_error<errc::missing_required_env>;
using service_name_collision_error = user_error<errc::service_name_collision>;

using action_execution_error  = external_error<errc::action_failed>;
using clean_error             = external_error<errc::clean_failure>;
using service_start_error     = external_error<errc::service_start_failed>;
using readiness_timeout_error = external_error<errc::readiness_timeout>;
using teardown_error          = external_error<errc::teardown_failed>;
using consumer_failure        = external_error<errc::consumer_failed>;
using deadline_exceeded_error = external_error<errc::deadline_exceeded>;

template <errc ErrorCode, typename... Args>
auto make_user_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    return user_error<ErrorCode>(fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <errc ErrorCode>
auto make_user_error() {
    return user_error<ErrorCode>(std::string(default_error_string(ErrorCode)));
}

template <errc ErrorCode, typename... Args>
auto make_external_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    return external_error<ErrorCode>(fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <errc ErrorCode>
auto make_external_error() {
    return external_error<ErrorCode>(std::string(default_error_string(ErrorCode)));
}

}  // namespace drydock
