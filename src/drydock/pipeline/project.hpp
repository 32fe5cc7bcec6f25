#pragma once

#include <drydock/env/service.hpp>
#include <drydock/error/nonesuch.hpp>
#include <drydock/graph/target_graph.hpp>
#include <drydock/util/env.hpp>
#include <drydock/util/fs/op.hpp>

#include <yaml-cpp/node/node.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace drydock {

/**
 * @brief A named set of test commands, and the services and environment they need.
 */
struct test_suite {
    std::string name;

    /// Shell commands run after the services are ready. Any non-zero exit fails the suite.
    std::vector<std::string> commands;
    /// Shell commands run before `commands`, e.g. a schema migration
    std::vector<std::string> setup;

    env_map                  env;
    std::vector<std::string> services;

    /// Variables that must be set, in the manifest or the environment, before anything starts
    std::vector<std::string> required_env;

    /// Limit on the run time of the whole suite
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::filesystem::path>     cwd;
};

struct clean_stage {};

struct build_stage {
    /// Targets to build. If empty, every target is built.
    std::vector<std::string> targets;
};

struct test_stage {
    std::string suite;
};

using pipeline_stage = std::variant<clean_stage, build_stage, test_stage>;

/// "clean", "build: a, b" (or "build: <all>"), or "test: <suite>"
std::string describe_stage(const pipeline_stage&);

struct pipeline_def {
    std::string                              name;
    std::vector<pipeline_stage>              stages;
    std::optional<std::chrono::milliseconds> timeout;
};

struct e_manifest_path {
    std::filesystem::path value;
};

/// Where in the manifest a problem was found, e.g. `suites.postgres.timeout`
struct e_manifest_key {
    std::string value;
};

struct e_bad_manifest_key : e_nonesuch {
    using e_nonesuch::e_nonesuch;
};

struct e_open_project {
    std::filesystem::path value;
};

/**
 * @brief Everything declared in a project's `drydock.yaml`.
 */
class project {
public:
    std::filesystem::path root;

    /// Environment for every action, service, and suite
    env_map env;

    /// Paths removed by the clean stage, along with every target output
    std::vector<std::filesystem::path> clean_paths;

    target_graph              graph;
    std::vector<service_spec> services;
    std::vector<test_suite>   suites;
    std::vector<pipeline_def> pipelines;

    explicit project(std::filesystem::path root_)
        : root(root_)
        , graph(std::move(root_)) {}

    /**
     * @brief Load `drydock.yaml` from the given directory.
     */
    static project open_directory(path_ref dirpath);

    /**
     * @brief Load the given manifest file. The project root is the directory containing it.
     */
    static project from_file(path_ref manifest);

    /**
     * @brief Build a project from parsed manifest data.
     *
     * Throws invalid_config_error for malformed data and unknown keys, and the graph validation
     * errors (unknown targets, cycles, duplicates) for a bad target graph.
     */
    static project from_yaml(const YAML::Node& data, std::filesystem::path root);

    const service_spec* find_service(std::string_view name) const noexcept;
    const test_suite*   find_suite(std::string_view name) const noexcept;
    const pipeline_def* find_pipeline(std::string_view name) const noexcept;

    /// Throws unknown_service_error (with a did-you-mean) if there is no such service
    const service_spec& get_service(std::string_view name) const;
    /// Throws unknown_suite_error (with a did-you-mean) if there is no such suite
    const test_suite& get_suite(std::string_view name) const;
    /// Throws unknown_pipeline_error (with a did-you-mean) if there is no such pipeline
    const pipeline_def& get_pipeline(std::string_view name) const;
};

}  // namespace drydock
