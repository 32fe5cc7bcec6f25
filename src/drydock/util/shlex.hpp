#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace drydock {

/**
 * @brief Split a command line into arguments following POSIX shell quoting rules (without any
 * expansion). Used for command prefixes taken from the environment, like the container runtime.
 */
std::vector<std::string> split_shell_string(std::string_view s);

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

}  // namespace drydock
