#pragma once

#include <string_view>

namespace drydock {

/**
 * @brief The lifecycle of a provisioned service:
 *
 *     not_started -> starting -> (ready | failed_to_start) -> tearing_down -> stopped
 */
enum class service_state {
    not_started,
    starting,
    ready,
    failed_to_start,
    tearing_down,
    stopped,
};

std::string_view to_string(service_state) noexcept;

}  // namespace drydock
