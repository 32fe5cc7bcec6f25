#include "./clean.hpp"

#include "./driver.hpp"
#include "./project.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/testing/testing.hpp>
#include <drydock/util/fs/io.hpp>
#include <drydock/util/yaml/parse.hpp>

#include <catch2/catch.hpp>

using namespace drydock;
using namespace std::chrono_literals;
using drydock::testing::write_aged_file;

namespace {

struct clean_fixture {
    temporary_dir tdir = temporary_dir::create();

    project load(std::string_view yaml) {
        return project::from_yaml(parse_yaml_string(yaml), tdir.path());
    }

    auto path(std::string_view p) const { return tdir.path() / p; }
    bool exists(std::string_view p) const { return std::filesystem::exists(path(p)); }
};

}  // namespace

TEST_CASE_METHOD(clean_fixture, "Clean removes the clean paths and every target output") {
    auto proj = load(R"(
clean: [node_modules, .cache]
targets:
  bundle:
    inputs: [src/app.ts]
    outputs: [static/build/bundle.js, static/build/bundle.css]
)");
    write_aged_file(path("node_modules/webpack/index.js"), "x", 10s);
    write_aged_file(path("static/build/bundle.js"), "x", 10s);
    write_aged_file(path("src/app.ts"), "x", 10s);

    CHECK(clean_paths_of(proj)
          == std::vector<std::filesystem::path>{
              path("node_modules"),
              path(".cache"),
              path("static/build/bundle.js"),
              path("static/build/bundle.css"),
          });

    auto ctx = make_pipeline_context(proj);
    CHECK(clean_project(ctx, proj) == 2);
    CHECK_FALSE(exists("node_modules"));
    CHECK_FALSE(exists("static/build/bundle.js"));
    CHECK(exists("static/build"));
    CHECK(exists("src/app.ts"));

    // Nothing left to remove
    CHECK(clean_project(ctx, proj) == 0);
}

TEST_CASE_METHOD(clean_fixture, "Clean refuses to leave the project directory") {
    for (auto bad : {"clean: [..]", "clean: [.]", "clean: [build/../..]", "clean: [/etc]"}) {
        INFO(bad);
        auto proj = load(bad);
        auto ctx  = make_pipeline_context(proj);
        CHECK_THROWS_AS(clean_project(ctx, proj), invalid_config_error);
    }
}

TEST_CASE_METHOD(clean_fixture, "Dry runs of clean remove nothing") {
    auto proj = load("clean: [dist]");
    write_aged_file(path("dist/app.js"), "x", 10s);
    auto ctx    = make_pipeline_context(proj);
    ctx.dry_run = true;
    CHECK(clean_project(ctx, proj) == 0);
    CHECK(exists("dist/app.js"));
}
