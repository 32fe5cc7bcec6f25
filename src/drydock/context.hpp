#pragma once

#include <drydock/env/state.hpp>
#include <drydock/util/env.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace drydock {

struct service_transition {
    std::string   service;
    service_state from;
    service_state to;
};

/**
 * @brief The state of a single drydock run, passed explicitly through the driver, the build
 * engine, and the service lifecycle manager.
 */
struct pipeline_context {
    using clock = std::chrono::steady_clock;

    /// Relative target paths and working directories resolve against this directory
    std::filesystem::path project_root;
    /// Holds service lock files and logs. Usually `<project-root>/.drydock`
    std::filesystem::path state_dir;

    /// Variables given to every action, service, and test command
    env_map env;

    std::optional<clock::time_point> deadline;

    bool dry_run = false;

    /// The short revision of the project checkout, if it could be determined
    std::optional<std::string> vcs_label;

    /// Names of services currently provisioned by this run
    std::set<std::string> active_services;

    /// Every service state transition, in the order they occurred
    std::vector<service_transition> transitions;

    /**
     * @brief Create a context rooted at the given directory, with the state directory beneath it.
     */
    static pipeline_context for_project(const std::filesystem::path& root);

    /// The environment passed to subprocesses: `env` plus DRYDOCK_VCS_LABEL when known
    env_map subprocess_env() const;

    void set_deadline_after(std::chrono::milliseconds);

    /// `dur` from now, saturating at the clock's largest time point
    static clock::time_point deadline_after(std::chrono::milliseconds dur) noexcept;

    /// Time left before the deadline (zero if it has passed), or nullopt without a deadline
    std::optional<std::chrono::milliseconds> time_remaining() const noexcept;

    bool deadline_passed() const noexcept;

    /**
     * @brief Throw deadline_exceeded_error if the deadline has passed. `during` names what was
     * about to happen, for the error message.
     */
    void check_deadline(std::string_view during) const;

    /// The smaller of the given timeout and the time remaining before the deadline
    std::optional<std::chrono::milliseconds>
    bound_timeout(std::optional<std::chrono::milliseconds> t) const noexcept;

    void record_transition(std::string_view service, service_state from, service_state to);
};

struct e_deadline {
    std::chrono::milliseconds overrun;
};

}  // namespace drydock
