#pragma once

#include "./target_graph.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace drydock {

struct pipeline_context;

struct execution_result {
    std::string name;

    int  exit_status = 0;
    int  signal      = 0;
    bool timed_out   = false;
    /// The target was up-to-date and nothing ran
    bool skipped = false;
    /// The target was stale, but this was a dry run
    bool dry_run = false;

    std::chrono::milliseconds duration{0};

    bool okay() const noexcept { return exit_status == 0 && signal == 0 && !timed_out; }
};

struct build_report {
    std::vector<execution_result> results;

    /// The target whose action failed, if any. Execution stopped there.
    std::optional<std::string> failed_target;
    /// The command line of the failed target that returned non-zero
    std::optional<std::string> failed_command;
    /// Stale targets after the failure, in plan order
    std::vector<std::string> not_attempted;

    bool okay() const noexcept { return !failed_target.has_value(); }

    /// Number of targets whose actions were actually run
    std::size_t n_executed() const noexcept;

    const execution_result* result_for(std::string_view name) const noexcept;

    /**
     * @brief Throw an action_execution_error naming the failed target and its exit status if the
     * build did not succeed.
     */
    void throw_if_failed() const;
};

/**
 * @brief Run the actions of the stale targets in a plan, in order. Stops at the first failing
 * command. Failure is reported in the build_report, not thrown.
 *
 * Throws deadline_exceeded_error if the pipeline deadline passes between targets, and
 * user_cancelled if the user interrupts an action.
 */
build_report execute(const target_graph& graph, const build_plan& plan, const pipeline_context& ctx);

}  // namespace drydock
