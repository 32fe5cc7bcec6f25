#pragma once

#include "./target.hpp"

#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drydock {

/**
 * @brief One target of a build plan, with a human-readable reason for why it will run.
 */
struct plan_step {
    const target* tgt;
    std::string   reason;
};

struct build_plan {
    /// Stale targets, in dependency order. Ties are broken by declaration order.
    std::vector<plan_step> execute;
    /// Targets of the requested closure that are already up-to-date
    std::vector<const target*> up_to_date;

    bool nothing_to_do() const noexcept { return execute.empty(); }
};

/**
 * @brief The set of declared targets and the edges between them.
 *
 * Edges come from `deps`, and from inputs that name another target's output.
 */
class target_graph {
    std::filesystem::path _root;

    // deque: references to targets remain valid as targets are added
    std::deque<target>                              _targets;
    std::map<std::string, std::size_t, std::less<>> _by_name;
    std::map<std::filesystem::path, std::size_t>    _by_output;

    std::filesystem::path _output_key(const std::filesystem::path& p) const;

public:
    explicit target_graph(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return _root; }

    /**
     * @brief Declare a new target.
     *
     * Throws duplicate_target_error if the name is taken, and duplicate_output_error if another
     * target already declares one of its outputs. A target without outputs is marked
     * `always_stale`.
     */
    const target& add(target t);

    const std::deque<target>& targets() const noexcept { return _targets; }

    const target* find(std::string_view name) const noexcept;

    /// Throws unknown_target_error (with a did-you-mean) if there is no such target
    const target& get(std::string_view name) const;

    /// The target that declares the given output path, if any
    const target* producer_of(const std::filesystem::path& p) const noexcept;

    /// The path of `p` as seen from the current directory
    std::filesystem::path resolve_path(const std::filesystem::path& p) const {
        return (_root / p).lexically_normal();
    }

    /**
     * @brief The targets that `t` directly depends on: its `deps` followed by the producers of its
     * inputs, without duplicates.
     *
     * Throws unknown_target_error if a dep names an undeclared target.
     */
    std::vector<const target*> upstream_of(const target& t) const;

    /**
     * @brief Search the whole graph for a dependency cycle. Returns its members in order, with the
     * first member repeated at the end, e.g. `a, b, a`.
     */
    std::optional<std::vector<std::string>> find_cycle() const;

    /**
     * @brief Check the edges of the graph: every dep must exist, and there must be no cycle.
     */
    void validate() const;

    /// Plan the build of the named targets and everything they depend on.
    build_plan resolve(std::string_view name) const;
    build_plan resolve(const std::vector<std::string>& names) const;
    /// Plan the build of every declared target.
    build_plan resolve_all() const;
};

}  // namespace drydock
