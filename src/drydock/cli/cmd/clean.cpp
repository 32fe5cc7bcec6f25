#include "./common.hpp"

#include "../options.hpp"

#include <drydock/env/process_runtime.hpp>
#include <drydock/pipeline/driver.hpp>
#include <drydock/util/log.hpp>

using namespace drydock;

namespace drydock::cli::cmd {

int clean(const options& opts) {
    auto            proj = load_project(opts);
    auto            ctx  = make_context(opts, proj);
    process_runtime runtime;
    auto            n = driver{proj, ctx, runtime}.clean();
    if (!ctx.dry_run) {
        drydock_log(info, "Removed {} path(s)", n);
    }
    return 0;
}

}  // namespace drydock::cli::cmd
