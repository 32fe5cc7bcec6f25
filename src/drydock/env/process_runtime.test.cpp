#include "./process_runtime.hpp"

#include "./lifecycle.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/util/fs/io.hpp>
#include <drydock/util/temp.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>

using namespace drydock;
using namespace std::chrono_literals;

namespace {

struct runtime_fixture {
    temporary_dir    tdir = temporary_dir::create();
    pipeline_context ctx  = pipeline_context::for_project(tdir.path());

    auto path(std::string_view p) const { return tdir.path() / p; }
};

service_spec shell_service(std::string name, std::string start, std::optional<std::string> stop) {
    service_spec spec;
    spec.name               = std::move(name);
    spec.start              = std::move(start);
    spec.stop               = std::move(stop);
    spec.ready.interval     = 20ms;
    spec.ready.max_attempts = 100;
    return spec;
}

}  // namespace

TEST_CASE("Expand a container image into runtime commands") {
    service_spec spec;
    spec.name  = "postgres";
    spec.env   = {{"POSTGRES_PASSWORD", "secret"}, {"POSTGRES_DB", "app"}};
    spec.image = container_image{
        .image    = "postgres:15",
        .ports    = {"5432:5432"},
        .run_args = {"--rm"},
        .command  = {"-c", "fsync=off"},
    };

    std::vector<std::string> cli = {"podman", "--remote"};
    CHECK(container_run_command(cli, spec)
          == std::vector<std::string>{"podman",
                                      "--remote",
                                      "run",
                                      "--name",
                                      "postgres",
                                      "-e",
                                      "POSTGRES_DB=app",
                                      "-e",
                                      "POSTGRES_PASSWORD=secret",
                                      "-p",
                                      "5432:5432",
                                      "--rm",
                                      "-d",
                                      "postgres:15",
                                      "-c",
                                      "fsync=off"});
    CHECK(container_rm_command(cli, spec)
          == std::vector<std::string>{"podman", "--remote", "rm", "-f", "postgres"});
}

TEST_CASE("The container runtime can be selected from the environment") {
    ::setenv("DRYDOCK_CONTAINER_RUNTIME", "sudo  podman", 1);
    CHECK(default_container_cli() == std::vector<std::string>{"sudo", "podman"});
    ::unsetenv("DRYDOCK_CONTAINER_RUNTIME");
    CHECK(default_container_cli() == std::vector<std::string>{"docker"});
}

TEST_CASE_METHOD(runtime_fixture, "Image services remove leftovers, start, and are removed") {
    // Stand-in for the container CLI that records its arguments
    process_runtime rt{{"sh", "-c", "echo \"$*\" >> calls.log", "container"}};

    service_spec spec;
    spec.name  = "db";
    spec.env   = {{"PASS", "x"}};
    spec.image = container_image{.image = "postgres:15", .ports = {"5432:5432"}};

    int consumed = 0;
    with_services(ctx, rt, {spec}, [&] { ++consumed; });
    CHECK(consumed == 1);
    CHECK(read_file(path("calls.log"))
          == "rm -f db\n"
             "run --name db -e PASS=x -p 5432:5432 -d postgres:15\n"
             "rm -f db\n");
}

TEST_CASE_METHOD(runtime_fixture, "Foreground services must start successfully") {
    process_runtime rt{{"docker"}};

    SECTION("Success") {
        auto spec = shell_service("svc", "echo \"$SVC_MODE\" > started.txt", "rm started.txt");
        spec.env  = {{"SVC_MODE", "test"}};
        with_services(ctx, rt, {spec}, [&] {
            CHECK(read_file(path("started.txt")) == "test\n");
        });
        CHECK_FALSE(std::filesystem::exists(path("started.txt")));
    }

    SECTION("Failure") {
        auto spec = shell_service("svc", "exit 4", "touch stopped.txt");
        CHECK_THROWS_AS(with_services(ctx, rt, {spec}, [] { FAIL("Consumer must not run"); }),
                        service_start_error);
        // Teardown runs even when the start failed
        CHECK(std::filesystem::exists(path("stopped.txt")));
    }
}

TEST_CASE_METHOD(runtime_fixture, "Readiness is checked with the probe command") {
    process_runtime rt{{"docker"}};
    // Becomes ready on the third check
    auto spec          = shell_service("svc", "true", std::nullopt);
    spec.ready.command = "echo x >> checks.txt; test $(wc -l < checks.txt) -ge 3";

    with_services(ctx, rt, {spec}, [] {});
    CHECK(read_file(path("checks.txt")) == "x\nx\nx\n");
}

TEST_CASE_METHOD(runtime_fixture, "Background services run until teardown") {
    process_runtime rt{{"docker"}};
    auto            spec = shell_service("server", "echo up > up.txt; exec sleep 30", std::nullopt);
    spec.background      = true;
    spec.ready.command   = "test -f up.txt";

    with_services(ctx, rt, {spec}, [&] {
        CHECK(std::filesystem::exists(path("up.txt")));
        CHECK(std::filesystem::exists(ctx.state_dir / "services" / "server.log"));
    });
}

TEST_CASE_METHOD(runtime_fixture, "A background service that exits early failed to start") {
    process_runtime rt{{"docker"}};
    auto            spec = shell_service("server", "echo crashing; exit 1", std::nullopt);
    spec.background      = true;
    spec.ready.command   = "false";

    CHECK_THROWS_AS(with_services(ctx, rt, {spec}, [] {}), service_start_error);
    CHECK(read_file(ctx.state_dir / "services" / "server.log") == "crashing\n");
}

TEST_CASE_METHOD(runtime_fixture, "A failing stop command is a teardown error") {
    process_runtime rt{{"docker"}};
    auto            spec = shell_service("svc", "true", "exit 2");
    rt.start(spec, ctx);
    CHECK_THROWS_AS(rt.stop(spec, ctx), teardown_error);
}
