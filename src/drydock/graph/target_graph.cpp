#include "./target_graph.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/error/nonesuch.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/dym.hpp>
#include <drydock/util/fs/op.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <neo/assert.hpp>

#include <algorithm>
#include <set>

using namespace drydock;

namespace fs = std::filesystem;

namespace {

/// The modification time of a file, or the newest of the files within a directory
std::optional<fs::file_time_type> newest_mtime(const fs::path& p) {
    auto own = file_mtime(p);
    if (!own || !fs::is_directory(p)) {
        return own;
    }
    std::optional<fs::file_time_type> newest;
    for (auto& entry : fs::recursive_directory_iterator(p)) {
        if (entry.is_regular_file()) {
            auto tm = entry.last_write_time();
            if (!newest || tm > *newest) {
                newest = tm;
            }
        }
    }
    return newest ? newest : own;
}

// The DFS visited status for a vertex
enum class vertex_status {
    unvisited,  // Never seen before
    visiting,   // Currently looking at its upstream; helps find cycles
    visited,    // Finished examining
};

struct vertex_info {
    vertex_status status = vertex_status::unvisited;
    // When `visiting`, points to the upstream vertex we are searching.
    // Can be chased to recover the cycle if we find one.
    const target* next = nullptr;
};

using vertex_map = std::map<const target*, vertex_info>;

// Returns a target in a cycle if one exists.
// The `vertex_info::next` pointers can be followed to recover the cycle.
const target* find_cycle_from(const target_graph& graph, vertex_map& vertices, const target& t) {
    auto& info = vertices[&t];
    if (info.status == vertex_status::visited) {
        return nullptr;
    } else if (info.status == vertex_status::visiting) {
        return &t;
    }

    info.status = vertex_status::visiting;
    for (auto up : graph.upstream_of(t)) {
        info.next = up;
        if (auto cyc = find_cycle_from(graph, vertices, *up)) {
            return cyc;
        }
    }
    info.status = vertex_status::visited;
    return nullptr;
}

}  // namespace

target_graph::target_graph(fs::path root)
    : _root(std::move(root)) {}

fs::path target_graph::_output_key(const fs::path& p) const { return resolve_path(p); }

const target& target_graph::add(target t) {
    DRYDOCK_E_SCOPE(e_target_name{t.name});
    if (_by_name.contains(t.name)) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::duplicate_target>(
            "Target '{}' is declared more than once",
            t.name));
    }
    for (auto& out : t.outputs) {
        auto key = _output_key(out);
        if (auto found = _by_output.find(key); found != _by_output.end()) {
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::duplicate_output>(
                                           "Output '{}' of target '{}' is also declared by "
                                           "target '{}'",
                                           out.string(),
                                           t.name,
                                           _targets[found->second].name),
                                       e_output_path{out});
        }
    }

    if (t.outputs.empty()) {
        // Nothing to compare timestamps against
        t.always_stale = true;
    }

    const auto index = _targets.size();
    for (auto& out : t.outputs) {
        _by_output.emplace(_output_key(out), index);
    }
    _by_name.emplace(t.name, index);
    _targets.push_back(std::move(t));
    return _targets.back();
}

const target* target_graph::find(std::string_view name) const noexcept {
    auto found = _by_name.find(name);
    if (found == _by_name.end()) {
        return nullptr;
    }
    return &_targets[found->second];
}

const target& target_graph::get(std::string_view name) const {
    if (auto t = find(name)) {
        return *t;
    }
    std::vector<std::string_view> names;
    for (auto& t : _targets) {
        names.push_back(t.name);
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_target>("There is no target named '{}'",
                                                                     name),
                               e_target_name{std::string(name)},
                               e_nonesuch{name, did_you_mean(name, names)});
}

const target* target_graph::producer_of(const fs::path& p) const noexcept {
    auto found = _by_output.find(_output_key(p));
    if (found == _by_output.end()) {
        return nullptr;
    }
    return &_targets[found->second];
}

std::vector<const target*> target_graph::upstream_of(const target& t) const {
    DRYDOCK_E_SCOPE(e_target_name{t.name});
    std::vector<const target*> ret;
    auto                       push = [&](const target* up) {
        if (std::ranges::find(ret, up) == ret.end()) {
            ret.push_back(up);
        }
    };
    for (auto& dep : t.deps) {
        push(&get(dep));
    }
    for (auto& in : t.inputs) {
        if (auto prod = producer_of(in)) {
            push(prod);
        }
    }
    return ret;
}

std::optional<std::vector<std::string>> target_graph::find_cycle() const {
    vertex_map vertices;
    // Reuse the same DFS state, so we still visit each vertex only once.
    for (auto& t : _targets) {
        if (auto cyclic = find_cycle_from(*this, vertices, t)) {
            // Follow `next`s to recover the cycle.
            std::vector<std::string> cycle;
            auto                     cur = cyclic;
            do {
                cycle.push_back(cur->name);
                cur = vertices[cur].next;
                neo_assert(invariant,
                           cur != nullptr,
                           "Broken chain while recovering a dependency cycle",
                           cycle.back());
            } while (cur != cyclic);
            cycle.push_back(cyclic->name);
            return cycle;
        }
    }
    return std::nullopt;
}

void target_graph::validate() const {
    drydock_log(trace, "Checking the target graph for cycles");
    if (auto cycle = find_cycle()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::dependency_cycle>(
                                       "Dependency cycle between targets: {}",
                                       joinstr(" -> ", *cycle)),
                                   e_dependency_cycle{*cycle});
    }
}

build_plan target_graph::resolve(std::string_view name) const {
    return resolve(std::vector<std::string>{std::string(name)});
}

build_plan target_graph::resolve_all() const {
    std::vector<std::string> names;
    for (auto& t : _targets) {
        names.push_back(t.name);
    }
    return resolve(names);
}

build_plan target_graph::resolve(const std::vector<std::string>& names) const {
    // Look up the requested targets before anything else, so that a typo is reported as such
    std::vector<const target*> requested;
    for (auto& name : names) {
        requested.push_back(&get(name));
    }

    validate();

    auto index_of = [&](const target* t) {
        return static_cast<std::size_t>(_by_name.find(t->name)->second);
    };

    // Collect the transitive closure of the requested targets
    std::set<const target*>    closure;
    std::vector<const target*> pending = requested;
    while (!pending.empty()) {
        auto t = pending.back();
        pending.pop_back();
        if (!closure.insert(t).second) {
            continue;
        }
        for (auto up : upstream_of(*t)) {
            pending.push_back(up);
        }
    }

    // Topological sort. Among the targets that are ready, the first-declared one goes first.
    std::map<const target*, std::size_t>                n_blocking;
    std::map<const target*, std::vector<const target*>> downstream;
    for (auto t : closure) {
        auto ups      = upstream_of(*t);
        n_blocking[t] = ups.size();
        for (auto up : ups) {
            downstream[up].push_back(t);
        }
    }
    std::set<std::size_t> ready;
    for (auto& [t, n] : n_blocking) {
        if (n == 0) {
            ready.insert(index_of(t));
        }
    }
    std::vector<const target*> order;
    while (!ready.empty()) {
        auto t = &_targets[*ready.begin()];
        ready.erase(ready.begin());
        order.push_back(t);
        for (auto down : downstream[t]) {
            if (--n_blocking[down] == 0) {
                ready.insert(index_of(down));
            }
        }
    }
    neo_assert(invariant,
               order.size() == closure.size(),
               "Topological sort did not reach every target, but no cycle was found",
               order.size(),
               closure.size());

    // Decide staleness in dependency order, so that upstream decisions are known
    build_plan              plan;
    std::set<const target*> stale;
    for (auto t : order) {
        DRYDOCK_E_SCOPE(e_target_name{t->name});

        std::optional<std::string>        upstream_reason;
        std::optional<fs::file_time_type> newest_input;
        std::string                       newest_input_name;

        auto consider = [&](const fs::path& p, fs::file_time_type tm) {
            if (!newest_input || tm > *newest_input) {
                newest_input      = tm;
                newest_input_name = p.string();
            }
        };

        for (auto& in : t->inputs) {
            auto prod = producer_of(in);
            if (prod && stale.contains(prod)) {
                if (!upstream_reason) {
                    upstream_reason = fmt::format("input '{}' will be regenerated by '{}'",
                                                  in.string(),
                                                  prod->name);
                }
                continue;
            }
            auto mtime = newest_mtime(resolve_path(in));
            if (!mtime) {
                BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::missing_input>(
                                               "Input '{}' of target '{}' does not exist, and no "
                                               "target produces it",
                                               in.string(),
                                               t->name),
                                           e_missing_input{in});
            }
            consider(in, *mtime);
        }

        for (auto& dep_name : t->deps) {
            auto& dep = get(dep_name);
            if (stale.contains(&dep)) {
                if (!upstream_reason) {
                    upstream_reason = fmt::format("dependency '{}' will be rebuilt", dep.name);
                }
                continue;
            }
            for (auto& out : dep.outputs) {
                if (auto mtime = file_mtime(resolve_path(out))) {
                    consider(out, *mtime);
                }
            }
        }

        std::optional<std::string> reason;
        if (t->always_stale) {
            reason = t->outputs.empty() ? "it declares no outputs" : "it is marked always-run";
        } else if (upstream_reason) {
            reason = upstream_reason;
        } else {
            std::optional<fs::file_time_type> oldest_output;
            std::string                       oldest_output_name;
            for (auto& out : t->outputs) {
                auto mtime = file_mtime(resolve_path(out));
                if (!mtime) {
                    reason = fmt::format("output '{}' does not exist", out.string());
                    break;
                }
                if (!oldest_output || *mtime < *oldest_output) {
                    oldest_output      = *mtime;
                    oldest_output_name = out.string();
                }
            }
            if (!reason && newest_input && oldest_output && *newest_input > *oldest_output) {
                reason = fmt::format("'{}' is newer than '{}'", newest_input_name, oldest_output_name);
            }
        }

        if (reason) {
            drydock_log(debug, "Target [{}] is stale: {}", t->name, *reason);
            stale.insert(t);
            plan.execute.push_back(plan_step{t, std::move(*reason)});
        } else {
            drydock_log(debug, "Target [{}] is up-to-date", t->name);
            plan.up_to_date.push_back(t);
        }
    }
    return plan;
}
