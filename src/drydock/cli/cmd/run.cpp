#include "./common.hpp"

#include "../options.hpp"

#include <drydock/env/process_runtime.hpp>
#include <drydock/pipeline/driver.hpp>

using namespace drydock;

namespace drydock::cli::cmd {

int run(const options& opts) {
    auto            proj = load_project(opts);
    auto            ctx  = make_context(opts, proj);
    process_runtime runtime;
    driver{proj, ctx, runtime}.run_pipeline(opts.run.pipeline);
    return 0;
}

}  // namespace drydock::cli::cmd
