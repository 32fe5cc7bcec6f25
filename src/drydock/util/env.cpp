#include "./env.hpp"

#include <neo/utility.hpp>

#include <cstdlib>

std::optional<std::string> drydock::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}

bool drydock::is_truthy_string(std::string_view s) noexcept {
    return s == neo::oper::any_of("1", "true", "on", "TRUE", "ON", "YES", "yes");
}

drydock::env_map drydock::merge_env(env_map base, const env_map& top) {
    for (auto& [key, value] : top) {
        base.insert_or_assign(key, value);
    }
    return base;
}
