#include "./driver.hpp"

#include "./clean.hpp"
#include "./test_executor.hpp"

#include <drydock/context.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/duration.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/time.hpp>

#include <fmt/format.h>

using namespace drydock;

pipeline_context drydock::make_pipeline_context(const project& proj) {
    auto ctx = pipeline_context::for_project(proj.root);
    ctx.env  = proj.env;
    return ctx;
}

build_report driver::build(const std::vector<std::string>& targets) {
    auto plan = targets.empty() ? _proj.graph.resolve_all() : _proj.graph.resolve(targets);
    for (auto t : plan.up_to_date) {
        drydock_log(debug, "[{}] is up-to-date", t->name);
    }
    if (plan.nothing_to_do()) {
        drydock_log(info, "All {} target(s) are up-to-date", plan.up_to_date.size());
    }
    auto report = execute(_proj.graph, plan, _ctx);
    report.throw_if_failed();
    return report;
}

int driver::clean() { return clean_project(_ctx, _proj); }

execution_result driver::test(std::string_view suite) {
    return run_suite(_ctx, _runtime, _proj, _proj.get_suite(suite));
}

void driver::run_stage(const pipeline_stage& st) {
    if (std::holds_alternative<clean_stage>(st)) {
        clean();
    } else if (auto b = std::get_if<build_stage>(&st)) {
        build(b->targets);
    } else {
        test(std::get<test_stage>(st).suite);
    }
}

void driver::run_pipeline(std::string_view name) {
    auto& pl = _proj.get_pipeline(name);
    DRYDOCK_E_SCOPE(e_pipeline_name{pl.name});

    if (pl.timeout) {
        auto limit = pipeline_context::deadline_after(*pl.timeout);
        if (!_ctx.deadline || limit < *_ctx.deadline) {
            _ctx.deadline = limit;
        }
    }

    stopwatch sw;
    int       index = 0;
    for (auto& st : pl.stages) {
        ++index;
        auto desc = describe_stage(st);
        DRYDOCK_E_SCOPE(e_pipeline_stage{index, desc});
        _ctx.check_deadline(fmt::format("stage {} ({})", index, desc));
        drydock_log(info, "Pipeline [{}]: stage {} ({})", pl.name, index, desc);
        run_stage(st);
    }
    drydock_log(info,
                "Pipeline [{}] passed all {} stage(s) in {}",
                pl.name,
                pl.stages.size(),
                format_duration(sw.elapsed_ms()));
}
