#include "./common.hpp"

#include "../options.hpp"

#include <drydock/pipeline/driver.hpp>
#include <drydock/pipeline/vcs.hpp>
#include <drydock/util/duration.hpp>
#include <drydock/util/log.hpp>

using namespace drydock;

project cli::load_project(const options& opts) {
    if (opts.manifest_file) {
        return project::from_file(*opts.manifest_file);
    }
    return project::open_directory(opts.project_dir);
}

pipeline_context cli::make_context(const options& opts, const project& proj) {
    auto ctx = make_pipeline_context(proj);
    if (opts.state_dir) {
        ctx.state_dir = fs::absolute(*opts.state_dir);
    }
    if (opts.deadline) {
        auto limit = parse_duration(*opts.deadline);
        drydock_log(debug, "Deadline is {} from now", format_duration(limit));
        ctx.set_deadline_after(limit);
    }
    ctx.dry_run   = opts.dry_run;
    ctx.vcs_label = query_vcs_label(proj.root);
    if (ctx.vcs_label) {
        drydock_log(debug, "Project revision is {}", *ctx.vcs_label);
    }
    return ctx;
}
