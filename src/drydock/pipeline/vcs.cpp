#include "./vcs.hpp"

#include <drydock/util/log.hpp>
#include <drydock/util/proc.hpp>
#include <drydock/util/string.hpp>

using namespace drydock;
using namespace std::chrono_literals;

std::optional<std::string> drydock::query_vcs_label(const std::filesystem::path& dir) {
    auto res = run_proc(proc_options{
        .command = {"git", "rev-parse", "--short", "HEAD"},
        .cwd     = dir,
        .timeout = 30s,
    });
    if (!res.okay()) {
        drydock_log(debug, "No VCS label for [{}]: git {}", dir.string(), res.describe());
        drydock_log(trace, "git output: {}", res.output);
        return std::nullopt;
    }
    auto label = std::string(trim_view(res.output));
    if (label.empty()) {
        return std::nullopt;
    }
    drydock_log(debug, "VCS label is [{}]", label);
    return label;
}
