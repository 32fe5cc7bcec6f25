#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace drydock {

struct e_duration_string {
    std::string value;
};

/// The longest duration accepted: what a steady_clock interval can hold (about 292 years)
inline constexpr std::chrono::milliseconds max_duration
    = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max());

/**
 * @brief Parse a duration: either a plain integer number of milliseconds, or an integer with one
 * of the suffixes `ms`, `s`, `m`, or `h`.
 *
 * Throws an invalid_config_error (with an e_duration_string) if the string is malformed or the
 * duration is longer than `max_duration`.
 */
std::chrono::milliseconds parse_duration(std::string_view);

/// Render a duration for humans, e.g. "1.5s" or "250ms"
std::string format_duration(std::chrono::milliseconds);

}  // namespace drydock
