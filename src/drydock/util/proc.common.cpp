#include "./proc.hpp"

#include <fmt/format.h>

using namespace drydock;

std::vector<std::string> drydock::shell_command(std::string_view cmd) {
    return {"/bin/sh", "-c", std::string(cmd)};
}

std::string proc_result::describe() const {
    if (timed_out) {
        return "timed out";
    } else if (signal != 0) {
        return fmt::format("was killed by signal {}", signal);
    } else {
        return fmt::format("exited with status {}", retc);
    }
}
