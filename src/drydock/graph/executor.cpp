#include "./executor.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/fs/op.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/proc.hpp>
#include <drydock/util/time.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>

#include <algorithm>

using namespace drydock;

namespace {

execution_result run_target(const target_graph&     graph,
                            const plan_step&        step,
                            const pipeline_context& ctx,
                            std::string&            failed_command) {
    auto& t = *step.tgt;

    execution_result res;
    res.name = t.name;

    if (ctx.dry_run) {
        drydock_log(info, "[dry-run] Would build [{}] because {}", t.name, step.reason);
        for (auto& cmd : t.commands) {
            drydock_log(info, "[dry-run]   {}", cmd);
        }
        res.dry_run = true;
        return res;
    }

    drydock_log(info, "Building [{}] ({})", t.name, step.reason);
    for (auto& out : t.outputs) {
        ensure_parent_dirs(graph.resolve_path(out));
    }

    auto cwd = t.cwd ? graph.resolve_path(*t.cwd) : graph.root();
    auto env = merge_env(ctx.subprocess_env(), t.env);

    stopwatch sw;
    for (auto& cmd : t.commands) {
        drydock_log(debug, "[{}] $ {}", t.name, cmd);
        auto proc = run_proc(proc_options{
            .command        = shell_command(cmd),
            .cwd            = cwd,
            .env            = env,
            .timeout        = ctx.bound_timeout(std::nullopt),
            .capture_output = false,
        });
        if (!proc.okay()) {
            res.exit_status = proc.retc;
            res.signal      = proc.signal;
            res.timed_out   = proc.timed_out;
            failed_command  = cmd;
            drydock_log(error, "Target [{}] failed: `{}` {}", t.name, cmd, proc.describe());
            break;
        }
    }
    res.duration = sw.elapsed_ms();

    if (res.okay()) {
        for (auto& out : t.outputs) {
            if (!file_exists(graph.resolve_path(out))) {
                drydock_log(warn,
                            "Target [{}] succeeded, but did not create its declared output '{}'",
                            t.name,
                            out.string());
            }
        }
        drydock_log(info, "Built [{}] in {}ms", t.name, res.duration.count());
    }
    return res;
}

}  // namespace

std::size_t build_report::n_executed() const noexcept {
    return static_cast<std::size_t>(std::ranges::count_if(results, [](auto& r) {
        return !r.skipped && !r.dry_run;
    }));
}

const execution_result* build_report::result_for(std::string_view name) const noexcept {
    auto found = std::ranges::find(results, name, &execution_result::name);
    if (found == results.end()) {
        return nullptr;
    }
    return &*found;
}

void build_report::throw_if_failed() const {
    if (okay()) {
        return;
    }
    auto        failed = result_for(*failed_target);
    std::string how;
    if (failed->timed_out) {
        how = "timed out";
    } else if (failed->signal != 0) {
        how = fmt::format("was killed by signal {}", failed->signal);
    } else {
        how = fmt::format("exited with status {}", failed->exit_status);
    }
    BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::action_failed>(
                                   "Target '{}' failed: command `{}` {}",
                                   *failed_target,
                                   failed_command.value_or("<unknown>"),
                                   how),
                               e_target_name{*failed_target},
                               e_failed_command{failed_command.value_or("")});
}

build_report
drydock::execute(const target_graph& graph, const build_plan& plan, const pipeline_context& ctx) {
    build_report report;

    for (auto t : plan.up_to_date) {
        drydock_log(debug, "Target [{}] is up-to-date", t->name);
        report.results.push_back(execution_result{.name = t->name, .skipped = true});
    }

    if (plan.nothing_to_do()) {
        drydock_log(info, "Everything is up-to-date");
        return report;
    }

    for (auto it = plan.execute.begin(); it != plan.execute.end(); ++it) {
        DRYDOCK_E_SCOPE(e_target_name{it->tgt->name});
        ctx.check_deadline(fmt::format("building target '{}'", it->tgt->name));

        std::string failed_command;
        auto        res = run_target(graph, *it, ctx, failed_command);
        report.results.push_back(res);
        if (!res.okay()) {
            report.failed_target  = res.name;
            report.failed_command = failed_command;
            for (auto rest = std::next(it); rest != plan.execute.end(); ++rest) {
                report.not_attempted.push_back(rest->tgt->name);
            }
            if (!report.not_attempted.empty()) {
                drydock_log(info,
                            "{} target(s) were not attempted because [{}] failed",
                            report.not_attempted.size(),
                            res.name);
            }
            break;
        }
    }
    return report;
}
