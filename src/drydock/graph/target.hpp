#pragma once

#include <drydock/util/env.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drydock {

/**
 * @brief A unit of file-driven work: a list of commands that produce `outputs` from `inputs`.
 *
 * All paths are relative to the project root unless they are absolute.
 */
struct target {
    std::string name;

    /// Files (or directories) the commands read. An input that is another target's output is an
    /// implicit dependency on that target.
    std::vector<std::filesystem::path> inputs;
    /// Targets that must be up-to-date before this one runs
    std::vector<std::string> deps;
    std::vector<std::filesystem::path> outputs;

    /// Shell command lines, run in order
    std::vector<std::string> commands;

    std::optional<std::filesystem::path> cwd;
    env_map                              env;

    /// Run every time, regardless of timestamps. Set for every target that declares no outputs.
    bool always_stale = false;
};

struct e_target_name {
    std::string value;
};

struct e_dependency_cycle {
    std::vector<std::string> members;
};

struct e_missing_input {
    std::filesystem::path value;
};

struct e_output_path {
    std::filesystem::path value;
};

struct e_failed_command {
    std::string value;
};

}  // namespace drydock
