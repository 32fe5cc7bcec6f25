#include "./common.hpp"

#include "../options.hpp"

#include <drydock/env/process_runtime.hpp>
#include <drydock/pipeline/driver.hpp>

using namespace drydock;

namespace drydock::cli::cmd {

int test(const options& opts) {
    auto            proj = load_project(opts);
    auto            ctx  = make_context(opts, proj);
    process_runtime runtime;
    driver{proj, ctx, runtime}.test(opts.test.suite);
    return 0;
}

}  // namespace drydock::cli::cmd
