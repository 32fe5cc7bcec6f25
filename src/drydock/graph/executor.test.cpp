#include "./executor.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/testing/testing.hpp>
#include <drydock/util/fs/io.hpp>

#include <catch2/catch.hpp>

using namespace drydock;
using namespace std::chrono_literals;
using drydock::testing::write_aged_file;

namespace {

struct exec_fixture {
    temporary_dir    tdir  = temporary_dir::create();
    target_graph     graph{tdir.path()};
    pipeline_context ctx = pipeline_context::for_project(tdir.path());

    auto path(std::string_view p) const { return tdir.path() / p; }

    build_report build(std::string_view name) { return execute(graph, graph.resolve(name), ctx); }
};

}  // namespace

TEST_CASE_METHOD(exec_fixture, "Rebuild a bundle only when its source changes") {
    write_aged_file(path("source.ts"), "export const x = 1;", 100s);
    graph.add(target{
        .name     = "bundle",
        .inputs   = {"source.ts"},
        .outputs  = {"bundle.js"},
        .commands = {"cat source.ts > bundle.js", "echo run >> runs.log"},
    });

    auto first = build("bundle");
    REQUIRE(first.okay());
    CHECK(first.n_executed() == 1);
    CHECK(read_file(path("bundle.js")) == "export const x = 1;");

    auto second = build("bundle");
    REQUIRE(second.okay());
    CHECK(second.n_executed() == 0);
    REQUIRE(second.result_for("bundle") != nullptr);
    CHECK(second.result_for("bundle")->skipped);

    // Touch the source
    std::filesystem::last_write_time(path("source.ts"),
                                     std::filesystem::file_time_type::clock::now() + 5s);
    auto third = build("bundle");
    CHECK(third.n_executed() == 1);
    CHECK(read_file(path("runs.log")) == "run\nrun\n");
}

TEST_CASE_METHOD(exec_fixture, "Outputs in new directories are given their parent directory") {
    graph.add(target{.name     = "gen",
                     .outputs  = {"build/gen/out.txt"},
                     .commands = {"echo hi > build/gen/out.txt"}});
    auto report = build("gen");
    CHECK(report.okay());
    CHECK(read_file(path("build/gen/out.txt")) == "hi\n");
}

TEST_CASE_METHOD(exec_fixture, "Execution stops at the first failing target") {
    graph.add(target{.name = "a", .commands = {"echo a >> order.log"}});
    graph.add(target{.name = "b", .deps = {"a"}, .commands = {"exit 3", "echo never >> order.log"}});
    graph.add(target{.name = "c", .deps = {"b"}, .commands = {"echo c >> order.log"}});
    graph.add(target{.name = "d", .deps = {"c"}, .commands = {"echo d >> order.log"}});

    auto report = build("d");
    CHECK_FALSE(report.okay());
    CHECK(report.failed_target == "b");
    CHECK(report.failed_command == "exit 3");
    CHECK(report.not_attempted == std::vector<std::string>{"c", "d"});
    REQUIRE(report.result_for("b") != nullptr);
    CHECK(report.result_for("b")->exit_status == 3);
    CHECK(report.result_for("c") == nullptr);
    CHECK(read_file(path("order.log")) == "a\n");

    boost::leaf::try_catch(
        [&] {
            report.throw_if_failed();
            FAIL("Expected an error");
        },
        [](const action_execution_error& err, e_target_name tn, e_failed_command cmd) {
            CHECK(tn.value == "b");
            CHECK(cmd.value == "exit 3");
            CHECK_THAT(err.what(), Catch::Contains("exited with status 3"));
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}

TEST_CASE_METHOD(exec_fixture, "A cycle prevents any action from running") {
    graph.add(target{.name = "a", .deps = {"b"}, .commands = {"touch ran-a"}});
    graph.add(target{.name = "b", .deps = {"a"}, .commands = {"touch ran-b"}});
    CHECK_THROWS_AS(build("a"), dependency_cycle_error);
    CHECK_FALSE(std::filesystem::exists(path("ran-a")));
    CHECK_FALSE(std::filesystem::exists(path("ran-b")));
}

TEST_CASE_METHOD(exec_fixture, "Dry runs do not execute anything") {
    ctx.dry_run = true;
    graph.add(target{.name = "gen", .outputs = {"out.txt"}, .commands = {"echo hi > out.txt"}});
    auto report = build("gen");
    CHECK(report.okay());
    CHECK(report.n_executed() == 0);
    REQUIRE(report.result_for("gen") != nullptr);
    CHECK(report.result_for("gen")->dry_run);
    CHECK_FALSE(std::filesystem::exists(path("out.txt")));
}

TEST_CASE_METHOD(exec_fixture, "Actions see the context and target environment") {
    ctx.env       = {{"APP_ENV", "ci"}, {"OVERRIDDEN", "no"}};
    ctx.vcs_label = "abc1234";
    graph.add(target{
        .name     = "env",
        .outputs  = {"sub/env.txt"},
        .commands = {"echo \"$APP_ENV $OVERRIDDEN $DRYDOCK_VCS_LABEL\" > env.txt"},
        .cwd      = "sub",
        .env      = {{"OVERRIDDEN", "yes"}},
    });
    auto report = build("env");
    CHECK(report.okay());
    CHECK(read_file(path("sub/env.txt")) == "ci yes abc1234\n");
}

TEST_CASE_METHOD(exec_fixture, "A passed deadline stops the build before the next target") {
    ctx.set_deadline_after(0ms);
    graph.add(target{.name = "gen", .commands = {"touch ran"}});
    CHECK_THROWS_AS(build("gen"), deadline_exceeded_error);
    CHECK_FALSE(std::filesystem::exists(path("ran")));
}
