#include "./common.hpp"

#include "../options.hpp"

#include <drydock/env/process_runtime.hpp>
#include <drydock/pipeline/driver.hpp>
#include <drydock/util/duration.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/time.hpp>

#include <algorithm>

using namespace drydock;

namespace drydock::cli::cmd {

int build(const options& opts) {
    auto            proj = load_project(opts);
    auto            ctx  = make_context(opts, proj);
    process_runtime runtime;
    stopwatch       sw;

    auto report  = driver{proj, ctx, runtime}.build(opts.build.targets);
    auto n_fresh
        = static_cast<std::size_t>(std::ranges::count_if(report.results, &execution_result::skipped));
    if (ctx.dry_run) {
        drydock_log(info,
                    "Dry run: {} target(s) would run, {} up-to-date",
                    report.results.size() - n_fresh,
                    n_fresh);
    } else {
        drydock_log(info,
                    "Build completed in {}: {} target(s) ran, {} up-to-date",
                    format_duration(sw.elapsed_ms()),
                    report.n_executed(),
                    n_fresh);
    }
    return 0;
}

}  // namespace drydock::cli::cmd
