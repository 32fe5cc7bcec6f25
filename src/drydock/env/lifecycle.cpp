#include "./lifecycle.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/error/try_catch.hpp>
#include <drydock/util/duration.hpp>
#include <drydock/util/flock.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/signal.hpp>
#include <drydock/util/time.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <neo/scope.hpp>

#include <memory>
#include <set>

using namespace drydock;

namespace {

struct started_service {
    const service_spec* spec;
    service_state       state;
};

void transition(pipeline_context& ctx, started_service& svc, service_state to) {
    ctx.record_transition(svc.spec->name, svc.state, to);
    svc.state = to;
}

[[noreturn]] void throw_collision(std::string_view name, std::string_view why) {
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::service_name_collision>(
                                   "Cannot provision service '{}': {}",
                                   name,
                                   why),
                               e_service_name{std::string(name)});
}

/// Take the lock files of all services, or throw if any of them is held elsewhere
std::vector<std::unique_ptr<file_lock>> claim_names(const pipeline_context&          ctx,
                                                    const std::vector<service_spec>& specs) {
    std::set<std::string_view> seen;
    for (auto& spec : specs) {
        if (!seen.insert(spec.name).second) {
            throw_collision(spec.name, "it is listed more than once");
        }
        if (ctx.active_services.contains(spec.name)) {
            throw_collision(spec.name,
                            "a service with that name is already running in this pipeline");
        }
    }

    std::vector<std::unique_ptr<file_lock>> locks;
    if (specs.empty()) {
        return locks;
    }
    auto lock_dir = ctx.state_dir / "services";
    std::filesystem::create_directories(lock_dir);
    for (auto& spec : specs) {
        auto lk = std::make_unique<file_lock>(lock_dir / (spec.name + ".lock"));
        if (!lk->try_lock()) {
            throw_collision(spec.name,
                            fmt::format("another drydock process holds [{}]",
                                        lk->path().string()));
        }
        locks.push_back(std::move(lk));
    }
    return locks;
}

void teardown_all(pipeline_context&             ctx,
                  service_runtime&              runtime,
                  std::vector<started_service>& started) noexcept {
    for (auto it = started.rbegin(); it != started.rend(); ++it) {
        auto& svc = *it;
        if (svc.state == service_state::starting) {
            transition(ctx, svc, service_state::failed_to_start);
        }
        transition(ctx, svc, service_state::tearing_down);
        drydock_log(info, "Tearing down service [{}]", svc.spec->name);
        drydock_leaf_try { runtime.stop(*svc.spec, ctx); }
        drydock_leaf_catch(const std::exception& e) {
            drydock_log(error,
                        "Service [{}] was not torn down cleanly: {}",
                        svc.spec->name,
                        e.what());
        }
        drydock_leaf_catch_all {
            drydock_log(error,
                        "Service [{}] was not torn down cleanly: {}",
                        svc.spec->name,
                        fmt::streamed(diagnostic_info));
        };
        transition(ctx, svc, service_state::stopped);
        ctx.active_services.erase(svc.spec->name);
    }
}

}  // namespace

int drydock::wait_until_ready(const pipeline_context& ctx,
                              service_runtime&        runtime,
                              const service_spec&     spec) {
    DRYDOCK_E_SCOPE(e_service_name{spec.name});
    auto& probe = spec.ready;

    // Whichever of the wait budget and the pipeline deadline is nearer bounds the loop
    auto       budget       = probe.budget;
    const auto remaining    = ctx.time_remaining();
    const bool deadline_cap = remaining && *remaining < budget;
    if (deadline_cap) {
        budget = *remaining;
    }

    stopwatch sw;
    int       attempts = 0;
    while (true) {
        ++attempts;
        auto left    = std::max(budget - sw.elapsed_ms(), std::chrono::milliseconds(1));
        auto timeout = std::min(probe.attempt_timeout, left);
        if (runtime.probe(spec, ctx, timeout)) {
            drydock_log(info,
                        "Service [{}] is ready ({} attempt(s), {})",
                        spec.name,
                        attempts,
                        format_duration(sw.elapsed_ms()));
            return attempts;
        }
        drydock_log(debug, "Service [{}] is not ready yet (attempt {})", spec.name, attempts);

        const bool out_of_attempts = attempts >= probe.max_attempts;
        const bool out_of_time     = sw.elapsed_ms() + probe.interval >= budget;
        if (out_of_time && deadline_cap && !out_of_attempts) {
            BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::deadline_exceeded>(
                                           "The pipeline deadline passed while waiting for "
                                           "service '{}' to become ready ({} attempts)",
                                           spec.name,
                                           attempts),
                                       e_readiness_attempts{attempts, sw.elapsed_ms()});
        }
        if (out_of_attempts || out_of_time) {
            BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::readiness_timeout>(
                                           "Service '{}' did not become ready after {} attempt(s) "
                                           "in {}",
                                           spec.name,
                                           attempts,
                                           format_duration(sw.elapsed_ms())),
                                       e_readiness_attempts{attempts, sw.elapsed_ms()});
        }
        sleep_interruptible(probe.interval);
    }
}

void drydock::with_services(pipeline_context&                ctx,
                            service_runtime&                 runtime,
                            const std::vector<service_spec>& specs,
                            const std::function<void()>&     consumer) {
    // Declared before the teardown below, so the locks are released after it runs
    auto locks = claim_names(ctx, specs);

    std::vector<started_service> started;
    started.reserve(specs.size());
    neo_defer { teardown_all(ctx, runtime, started); };

    for (auto& spec : specs) {
        DRYDOCK_E_SCOPE(e_service_name{spec.name});
        ctx.check_deadline(fmt::format("starting service '{}'", spec.name));

        auto& svc = started.emplace_back(started_service{&spec, service_state::not_started});
        ctx.active_services.insert(spec.name);
        transition(ctx, svc, service_state::starting);

        drydock_log(info, "Starting service [{}]", spec.name);
        runtime.start(spec, ctx);
        wait_until_ready(ctx, runtime, spec);
        transition(ctx, svc, service_state::ready);
    }

    consumer();
}
