#include "./context.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace drydock;
using namespace std::chrono_literals;

pipeline_context pipeline_context::for_project(const std::filesystem::path& root) {
    pipeline_context ctx;
    ctx.project_root = std::filesystem::absolute(root).lexically_normal();
    ctx.state_dir    = ctx.project_root / ".drydock";
    return ctx;
}

env_map pipeline_context::subprocess_env() const {
    auto ret = env;
    if (vcs_label) {
        ret.insert_or_assign("DRYDOCK_VCS_LABEL", *vcs_label);
    }
    return ret;
}

void pipeline_context::set_deadline_after(std::chrono::milliseconds dur) {
    deadline = deadline_after(dur);
}

pipeline_context::clock::time_point
pipeline_context::deadline_after(std::chrono::milliseconds dur) noexcept {
    const auto now = clock::now();
    const auto headroom
        = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
    if (dur >= headroom) {
        return clock::time_point::max();
    }
    return now + dur;
}

std::optional<std::chrono::milliseconds> pipeline_context::time_remaining() const noexcept {
    if (!deadline) {
        return std::nullopt;
    }
    auto now = clock::now();
    if (now >= *deadline) {
        return 0ms;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
}

bool pipeline_context::deadline_passed() const noexcept {
    return deadline && clock::now() >= *deadline;
}

void pipeline_context::check_deadline(std::string_view during) const {
    if (!deadline_passed()) {
        return;
    }
    auto overrun = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - *deadline);
    BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::deadline_exceeded>(
                                   "The pipeline deadline passed before {}",
                                   during),
                               e_deadline{overrun});
}

std::optional<std::chrono::milliseconds>
pipeline_context::bound_timeout(std::optional<std::chrono::milliseconds> t) const noexcept {
    auto remain = time_remaining();
    if (!remain) {
        return t;
    }
    if (!t) {
        return remain;
    }
    return std::min(*t, *remain);
}

void pipeline_context::record_transition(std::string_view service,
                                         service_state    from,
                                         service_state    to) {
    drydock_log(debug,
                "Service [{}]: {} -> {}",
                service,
                drydock::to_string(from),
                drydock::to_string(to));
    transitions.push_back({std::string(service), from, to});
}
