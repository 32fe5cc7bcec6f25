#include "./target_graph.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/error/nonesuch.hpp>
#include <drydock/testing/testing.hpp>

#include <catch2/catch.hpp>

using namespace drydock;
using namespace std::chrono_literals;
using drydock::testing::write_aged_file;

namespace {

std::vector<std::string> names_of(const build_plan& plan) {
    std::vector<std::string> ret;
    for (auto& step : plan.execute) {
        ret.push_back(step.tgt->name);
    }
    return ret;
}

struct graph_fixture {
    temporary_dir tdir  = temporary_dir::create();
    target_graph  graph{tdir.path()};

    auto path(std::string_view p) const { return tdir.path() / p; }
};

}  // namespace

TEST_CASE_METHOD(graph_fixture, "Targets with fresh outputs are not planned") {
    write_aged_file(path("src.txt"), "source", 100s);
    write_aged_file(path("out.txt"), "output", 10s);
    graph.add(target{.name = "copy", .inputs = {"src.txt"}, .outputs = {"out.txt"}});

    auto plan = graph.resolve("copy");
    CHECK(plan.nothing_to_do());
    REQUIRE(plan.up_to_date.size() == 1);
    CHECK(plan.up_to_date[0]->name == "copy");
}

TEST_CASE_METHOD(graph_fixture, "Staleness by timestamp and existence") {
    write_aged_file(path("src.txt"), "source", 10s);
    graph.add(target{.name = "copy", .inputs = {"src.txt"}, .outputs = {"out.txt"}});

    SECTION("Missing output") {
        auto plan = graph.resolve("copy");
        REQUIRE(names_of(plan) == std::vector<std::string>{"copy"});
        CHECK(plan.execute[0].reason == "output 'out.txt' does not exist");
    }

    SECTION("Output older than its input") {
        write_aged_file(path("out.txt"), "output", 100s);
        auto plan = graph.resolve("copy");
        REQUIRE(names_of(plan) == std::vector<std::string>{"copy"});
        CHECK(plan.execute[0].reason == "'src.txt' is newer than 'out.txt'");
    }

    SECTION("Output with the same timestamp as its input is fresh") {
        write_aged_file(path("out.txt"), "output", 10s);
        std::filesystem::last_write_time(path("out.txt"),
                                         std::filesystem::last_write_time(path("src.txt")));
        CHECK(graph.resolve("copy").nothing_to_do());
    }
}

TEST_CASE_METHOD(graph_fixture, "Targets without outputs, and always-run targets, are always stale") {
    write_aged_file(path("src.txt"), "source", 100s);
    write_aged_file(path("out.txt"), "output", 10s);
    CHECK(graph.add(target{.name = "lint", .inputs = {"src.txt"}}).always_stale);
    graph.add(target{.name         = "stamp",
                     .inputs       = {"src.txt"},
                     .outputs      = {"out.txt"},
                     .always_stale = true});

    auto plan = graph.resolve_all();
    CHECK(names_of(plan) == std::vector<std::string>{"lint", "stamp"});
    CHECK(plan.execute[0].reason == "it declares no outputs");
    CHECK(plan.execute[1].reason == "it is marked always-run");
}

TEST_CASE_METHOD(graph_fixture, "Inputs produced by other targets create dependency edges") {
    write_aged_file(path("schema.sql"), "create table", 100s);
    // Declared in reverse order of execution
    graph.add(target{.name = "test-db", .inputs = {"build/schema.sql"}, .outputs = {"db.stamp"}});
    graph.add(target{.name    = "gen-schema",
                     .inputs  = {"schema.sql"},
                     .outputs = {"build/schema.sql"}});

    auto up = graph.upstream_of(graph.get("test-db"));
    REQUIRE(up.size() == 1);
    CHECK(up[0]->name == "gen-schema");

    auto plan = graph.resolve("test-db");
    CHECK(names_of(plan) == std::vector<std::string>{"gen-schema", "test-db"});
    CHECK(plan.execute[1].reason == "input 'build/schema.sql' will be regenerated by 'gen-schema'");
}

TEST_CASE_METHOD(graph_fixture, "A stale upstream target makes its dependents stale") {
    write_aged_file(path("a.in"), "a", 100s);
    write_aged_file(path("b.out"), "b", 1s);
    graph.add(target{.name = "a", .inputs = {"a.in"}, .outputs = {"a.out"}});
    graph.add(target{.name = "b", .deps = {"a"}, .outputs = {"b.out"}});

    auto plan = graph.resolve("b");
    CHECK(names_of(plan) == std::vector<std::string>{"a", "b"});
    CHECK(plan.execute[1].reason == "dependency 'a' will be rebuilt");
}

TEST_CASE_METHOD(graph_fixture, "Output of a dependency newer than our output makes us stale") {
    write_aged_file(path("a.in"), "a", 100s);
    write_aged_file(path("a.out"), "a", 5s);
    write_aged_file(path("b.out"), "b", 50s);
    graph.add(target{.name = "a", .inputs = {"a.in"}, .outputs = {"a.out"}});
    graph.add(target{.name = "b", .deps = {"a"}, .outputs = {"b.out"}});

    auto plan = graph.resolve("b");
    CHECK(names_of(plan) == std::vector<std::string>{"b"});
    REQUIRE(plan.up_to_date.size() == 1);
    CHECK(plan.up_to_date[0]->name == "a");
}

TEST_CASE_METHOD(graph_fixture, "Ties in dependency order follow declaration order") {
    graph.add(target{.name = "z"});
    graph.add(target{.name = "y"});
    graph.add(target{.name = "all", .deps = {"y", "z"}});
    graph.add(target{.name = "x"});

    CHECK(names_of(graph.resolve("all")) == std::vector<std::string>{"z", "y", "all"});
    CHECK(names_of(graph.resolve_all()) == std::vector<std::string>{"z", "y", "all", "x"});
}

TEST_CASE_METHOD(graph_fixture, "Directory inputs use the newest file within them") {
    write_aged_file(path("web/src/index.ts"), "1", 100s);
    write_aged_file(path("web/src/deep/util.ts"), "2", 100s);
    write_aged_file(path("web/dist/app.js"), "bundle", 50s);
    graph.add(target{.name = "web", .inputs = {"web/src"}, .outputs = {"web/dist/app.js"}});

    CHECK(graph.resolve("web").nothing_to_do());
    write_aged_file(path("web/src/deep/util.ts"), "3", 1s);
    CHECK(names_of(graph.resolve("web")) == std::vector<std::string>{"web"});
}

TEST_CASE_METHOD(graph_fixture, "A missing raw input is an error") {
    graph.add(target{.name = "copy", .inputs = {"nope.txt"}, .outputs = {"out.txt"}});
    boost::leaf::try_catch(
        [&] {
            graph.resolve("copy");
            FAIL("Expected an error");
        },
        [](boost::leaf::catch_<missing_input_error>, e_missing_input in, e_target_name tn) {
            CHECK(in.value == "nope.txt");
            CHECK(tn.value == "copy");
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}

TEST_CASE_METHOD(graph_fixture, "Cycles are found before anything runs") {
    graph.add(target{.name = "a", .deps = {"b"}});
    graph.add(target{.name = "b", .deps = {"a"}});
    graph.add(target{.name = "c"});

    auto cycle = graph.find_cycle();
    REQUIRE(cycle.has_value());
    CHECK(*cycle == std::vector<std::string>{"a", "b", "a"});

    boost::leaf::try_catch(
        [&] {
            graph.resolve("c");
            FAIL("Expected an error");
        },
        [](const dependency_cycle_error& err, e_dependency_cycle cyc) {
            CHECK(cyc.members == std::vector<std::string>{"a", "b", "a"});
            CHECK_THAT(err.what(), Catch::Contains("a -> b -> a"));
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}

TEST_CASE_METHOD(graph_fixture, "A target reading its own output is a cycle") {
    graph.add(target{.name = "self", .inputs = {"x.txt"}, .outputs = {"./x.txt"}});
    auto cycle = graph.find_cycle();
    REQUIRE(cycle.has_value());
    CHECK(*cycle == std::vector<std::string>{"self", "self"});
}

TEST_CASE_METHOD(graph_fixture, "Unknown targets are reported with a suggestion") {
    graph.add(target{.name = "bundle"});
    graph.add(target{.name = "lint"});
    boost::leaf::try_catch(
        [&] {
            graph.resolve("bundel");
            FAIL("Expected an error");
        },
        [](boost::leaf::catch_<unknown_target_error>, e_nonesuch missing) {
            CHECK(missing.given == "bundel");
            CHECK(missing.nearest == "bundle");
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });

    graph.add(target{.name = "test", .deps = {"lnt"}});
    CHECK_THROWS_AS(graph.resolve("test"), unknown_target_error);
}

TEST_CASE_METHOD(graph_fixture, "Duplicate declarations are rejected") {
    graph.add(target{.name = "a", .outputs = {"out/a.txt"}});
    CHECK_THROWS_AS(graph.add(target{.name = "a"}), duplicate_target_error);
    CHECK_THROWS_AS(graph.add(target{.name = "b", .outputs = {"out/../out/a.txt"}}),
                    duplicate_output_error);
    CHECK(graph.targets().size() == 1);
}
