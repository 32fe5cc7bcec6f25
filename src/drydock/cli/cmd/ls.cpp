#include "./common.hpp"

#include "../options.hpp"

#include <drydock/util/duration.hpp>
#include <drydock/util/string.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <iostream>

namespace drydock::cli::cmd {

namespace {

std::string path_list(const std::vector<fs::path>& paths) {
    std::vector<std::string> strs;
    for (auto& p : paths) {
        strs.push_back(p.string());
    }
    return joinstr(", ", strs);
}

void print_targets(const project& proj) {
    fmt::print(std::cout, "Targets:\n");
    for (auto& t : proj.graph.targets()) {
        fmt::print(std::cout, "  {}{}\n", t.name, t.always_stale ? " (always-run)" : "");
        if (!t.deps.empty()) {
            fmt::print(std::cout, "    deps:    {}\n", joinstr(", ", t.deps));
        }
        if (!t.inputs.empty()) {
            fmt::print(std::cout, "    inputs:  {}\n", path_list(t.inputs));
        }
        if (!t.outputs.empty()) {
            fmt::print(std::cout, "    outputs: {}\n", path_list(t.outputs));
        }
    }
}

void print_services(const project& proj) {
    fmt::print(std::cout, "Services:\n");
    for (auto& svc : proj.services) {
        if (svc.image) {
            fmt::print(std::cout, "  {} (image {})\n", svc.name, svc.image->image);
        } else {
            fmt::print(std::cout,
                       "  {}{}\n",
                       svc.name,
                       svc.background ? " (background)" : "");
        }
    }
}

void print_suites(const project& proj) {
    fmt::print(std::cout, "Test suites:\n");
    for (auto& suite : proj.suites) {
        fmt::print(std::cout, "  {}", suite.name);
        if (!suite.services.empty()) {
            fmt::print(std::cout, " (with {})", joinstr(", ", suite.services));
        }
        std::cout << '\n';
    }
}

void print_pipelines(const project& proj) {
    fmt::print(std::cout, "Pipelines:\n");
    for (auto& pl : proj.pipelines) {
        fmt::print(std::cout, "  {}", pl.name);
        if (pl.timeout) {
            fmt::print(std::cout, " (timeout {})", format_duration(*pl.timeout));
        }
        std::cout << '\n';
        int index = 0;
        for (auto& st : pl.stages) {
            fmt::print(std::cout, "    {}. {}\n", ++index, describe_stage(st));
        }
    }
}

}  // namespace

int ls(const options& opts) {
    auto proj = load_project(opts);
    print_targets(proj);
    print_services(proj);
    print_suites(proj);
    print_pipelines(proj);
    return 0;
}

}  // namespace drydock::cli::cmd
