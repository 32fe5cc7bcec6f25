#pragma once

#include <neo/concepts.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace drydock {

/**
 * @brief An ordered set of environment variable overrides. Passed through to subprocesses as-is.
 */
using env_map = std::map<std::string, std::string>;

std::optional<std::string> getenv(const std::string& env) noexcept;

bool is_truthy_string(std::string_view s) noexcept;

template <neo::invocable Func>
std::string getenv(const std::string& name, Func&& fn) noexcept(noexcept(fn())) {
    auto val = getenv(name);
    if (!val) {
        return std::string(fn());
    }
    return *val;
}

/**
 * @brief Overlay `top` onto `base`. Keys in `top` win.
 */
env_map merge_env(env_map base, const env_map& top);

}  // namespace drydock
