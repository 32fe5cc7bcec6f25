#include "./lifecycle.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/util/flock.hpp>
#include <drydock/util/signal.hpp>
#include <drydock/util/temp.hpp>

#include <boost/leaf.hpp>
#include <catch2/catch.hpp>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>

using namespace drydock;
using namespace std::chrono_literals;

namespace {

/// Records every call, and becomes ready after a configurable number of probes
class fake_runtime : public service_runtime {
public:
    std::vector<std::string>   calls;
    std::map<std::string, int> probes;

    /// Probes needed before each service is ready. Services not listed are ready at once.
    std::map<std::string, int> ready_after;
    std::set<std::string>      fail_start;
    std::set<std::string>      fail_stop;

    void start(const service_spec& spec, const pipeline_context&) override {
        calls.push_back("start " + spec.name);
        if (fail_start.contains(spec.name)) {
            throw make_external_error<errc::service_start_failed>("{} refused to start",
                                                                  spec.name);
        }
    }

    bool probe(const service_spec& spec, const pipeline_context&, std::chrono::milliseconds) override {
        calls.push_back("probe " + spec.name);
        auto n = ++probes[spec.name];
        if (auto want = ready_after.find(spec.name); want != ready_after.end()) {
            return want->second >= 0 && n >= want->second;
        }
        return true;
    }

    void stop(const service_spec& spec, const pipeline_context&) override {
        calls.push_back("stop " + spec.name);
        if (fail_stop.contains(spec.name)) {
            throw make_external_error<errc::teardown_failed>("{} refused to stop", spec.name);
        }
    }

    int count(std::string_view call) const {
        return static_cast<int>(std::ranges::count(calls, call));
    }
};

service_spec quick_service(std::string name, int max_attempts = 3) {
    service_spec spec;
    spec.name               = std::move(name);
    spec.ready.command      = "true";
    spec.ready.interval     = 1ms;
    spec.ready.max_attempts = max_attempts;
    return spec;
}

struct lifecycle_fixture {
    temporary_dir    tdir = temporary_dir::create();
    pipeline_context ctx  = pipeline_context::for_project(tdir.path());
    fake_runtime     runtime;

    std::vector<std::pair<std::string, service_state>> transitions_to() const {
        std::vector<std::pair<std::string, service_state>> ret;
        for (auto& t : ctx.transitions) {
            ret.emplace_back(t.service, t.to);
        }
        return ret;
    }
};

}  // namespace

TEST_CASE_METHOD(lifecycle_fixture, "A database that is ready on the second probe") {
    runtime.ready_after["db"] = 2;
    int consumed              = 0;
    with_services(ctx, runtime, {quick_service("db", 3)}, [&] {
        ++consumed;
        CHECK(ctx.active_services.contains("db"));
    });

    CHECK(consumed == 1);
    CHECK(runtime.probes["db"] == 2);
    CHECK(runtime.count("start db") == 1);
    CHECK(runtime.count("stop db") == 1);
    CHECK(ctx.active_services.empty());

    using S = service_state;
    CHECK(transitions_to()
          == std::vector<std::pair<std::string, S>>{
              {"db", S::starting},
              {"db", S::ready},
              {"db", S::tearing_down},
              {"db", S::stopped},
          });
}

TEST_CASE_METHOD(lifecycle_fixture, "A probe that never succeeds times out and tears down once") {
    runtime.ready_after["db"] = -1;
    bool consumed             = false;

    boost::leaf::try_catch(
        [&] {
            with_services(ctx, runtime, {quick_service("db", 3)}, [&] { consumed = true; });
            FAIL("Expected a readiness timeout");
        },
        [&](const readiness_timeout_error& err, e_service_name name, e_readiness_attempts att) {
            CHECK(name.value == "db");
            CHECK(att.attempts == 3);
            CHECK_THAT(err.what(), Catch::Contains("after 3 attempt(s)"));
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });

    CHECK_FALSE(consumed);
    CHECK(runtime.probes["db"] == 3);
    CHECK(runtime.count("stop db") == 1);

    using S = service_state;
    CHECK(transitions_to()
          == std::vector<std::pair<std::string, S>>{
              {"db", S::starting},
              {"db", S::failed_to_start},
              {"db", S::tearing_down},
              {"db", S::stopped},
          });
}

TEST_CASE_METHOD(lifecycle_fixture, "The wait budget bounds readiness polling") {
    runtime.ready_after["db"] = -1;
    auto spec                 = quick_service("db", 1'000'000);
    spec.ready.interval       = 10ms;
    spec.ready.budget         = 100ms;
    CHECK_THROWS_AS(with_services(ctx, runtime, {spec}, [] {}), readiness_timeout_error);
    CHECK(runtime.probes["db"] < 50);
    CHECK(runtime.count("stop db") == 1);
}

TEST_CASE_METHOD(lifecycle_fixture, "A near deadline bounds readiness polling") {
    runtime.ready_after["db"] = -1;
    auto spec                 = quick_service("db", 1'000'000);
    spec.ready.interval       = 10ms;
    ctx.set_deadline_after(100ms);
    CHECK_THROWS_AS(with_services(ctx, runtime, {spec}, [] {}), deadline_exceeded_error);
    CHECK(runtime.count("stop db") == 1);
}

TEST_CASE_METHOD(lifecycle_fixture, "Services are torn down in reverse order when the consumer fails") {
    std::vector<service_spec> specs
        = {quick_service("db"), quick_service("cache"), quick_service("queue")};

    CHECK_THROWS_AS(with_services(ctx,
                                  runtime,
                                  specs,
                                  [] {
                                      throw make_external_error<errc::consumer_failed>(
                                          "Tests failed");
                                  }),
                    consumer_failure);

    CHECK(runtime.calls
          == std::vector<std::string>{
              "start db",
              "probe db",
              "start cache",
              "probe cache",
              "start queue",
              "probe queue",
              "stop queue",
              "stop cache",
              "stop db",
          });
}

TEST_CASE_METHOD(lifecycle_fixture, "A start failure tears down only what was started") {
    runtime.fail_start.insert("cache");
    bool consumed = false;
    CHECK_THROWS_AS(with_services(ctx,
                                  runtime,
                                  {quick_service("db"), quick_service("cache"), quick_service("queue")},
                                  [&] { consumed = true; }),
                    service_start_error);
    CHECK_FALSE(consumed);
    CHECK(runtime.calls
          == std::vector<std::string>{
              "start db",
              "probe db",
              "start cache",
              "stop cache",
              "stop db",
          });
}

TEST_CASE_METHOD(lifecycle_fixture, "Teardown failures do not mask the original error") {
    runtime.fail_stop.insert("db");
    CHECK_THROWS_AS(with_services(ctx,
                                  runtime,
                                  {quick_service("db"), quick_service("cache")},
                                  [] {
                                      throw make_external_error<errc::consumer_failed>(
                                          "Tests failed");
                                  }),
                    consumer_failure);
    CHECK(runtime.count("stop cache") == 1);
    CHECK(runtime.count("stop db") == 1);
    CHECK(ctx.active_services.empty());
}

TEST_CASE_METHOD(lifecycle_fixture, "Teardown failures after success are not fatal") {
    runtime.fail_stop.insert("db");
    int consumed = 0;
    with_services(ctx, runtime, {quick_service("db")}, [&] { ++consumed; });
    CHECK(consumed == 1);
    CHECK(runtime.count("stop db") == 1);
}

TEST_CASE_METHOD(lifecycle_fixture, "Name collisions fail before anything starts") {
    SECTION("Duplicate names in one call") {
        CHECK_THROWS_AS(with_services(ctx,
                                      runtime,
                                      {quick_service("db"), quick_service("db")},
                                      [] {}),
                        service_name_collision_error);
        CHECK(runtime.calls.empty());
    }

    SECTION("Nested provisioning of an active name") {
        CHECK_THROWS_AS(with_services(ctx,
                                      runtime,
                                      {quick_service("db")},
                                      [&] {
                                          with_services(ctx,
                                                        runtime,
                                                        {quick_service("db")},
                                                        [] {});
                                      }),
                        service_name_collision_error);
        // The outer service was still torn down
        CHECK(runtime.count("start db") == 1);
        CHECK(runtime.count("stop db") == 1);
    }

    SECTION("A lock file held by another process") {
        auto lock_path = ctx.state_dir / "services" / "db.lock";
        std::filesystem::create_directories(lock_path.parent_path());

        int ready_pipe[2] = {};
        REQUIRE(::pipe(ready_pipe) == 0);
        auto pid = ::fork();
        REQUIRE(pid != -1);
        if (pid == 0) {
            ::close(ready_pipe[0]);
            file_lock lk{lock_path};
            char      locked = lk.try_lock() ? 1 : 0;
            [[maybe_unused]] auto n = ::write(ready_pipe[1], &locked, 1);
            ::pause();
            std::_Exit(0);
        }
        ::close(ready_pipe[1]);
        char locked = 0;
        REQUIRE(::read(ready_pipe[0], &locked, 1) == 1);
        ::close(ready_pipe[0]);
        REQUIRE(locked == 1);

        CHECK_THROWS_AS(with_services(ctx, runtime, {quick_service("db")}, [] {}),
                        service_name_collision_error);
        CHECK(runtime.calls.empty());

        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
    }

    SECTION("A second pipeline in this process holds the name") {
        auto other = pipeline_context::for_project(tdir.path());
        REQUIRE(other.state_dir == ctx.state_dir);
        bool still_held = false;
        with_services(other, runtime, {quick_service("db")}, [&] {
            CHECK_THROWS_AS(with_services(ctx, runtime, {quick_service("db")}, [] {}),
                            service_name_collision_error);
            // The failed attempt must not have released the running pipeline's lock
            file_lock lock_again{ctx.state_dir / "services" / "db.lock"};
            still_held = !lock_again.try_lock();
        });
        CHECK(still_held);
        CHECK(runtime.count("start db") == 1);
        CHECK(runtime.count("stop db") == 1);
    }
}

TEST_CASE_METHOD(lifecycle_fixture, "Lock files are released after teardown") {
    with_services(ctx, runtime, {quick_service("db")}, [] {});
    file_lock again{ctx.state_dir / "services" / "db.lock"};
    CHECK(again.try_lock());
}

TEST_CASE_METHOD(lifecycle_fixture, "Cancellation in the consumer still tears everything down") {
    CHECK_THROWS_AS(with_services(ctx,
                                  runtime,
                                  {quick_service("db"), quick_service("web")},
                                  [] { throw user_cancelled(); }),
                    user_cancelled);
    CHECK(runtime.count("stop web") == 1);
    CHECK(runtime.count("stop db") == 1);
}
