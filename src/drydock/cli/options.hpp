#pragma once

#include <drydock/util/log.hpp>
#include <debate/argument_parser.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drydock {

namespace fs = std::filesystem;

namespace cli {

/**
 * @brief Top-level drydock subcommands
 */
enum class subcommand {
    _none_,
    build,
    clean,
    test,
    run,
    ls,
};

/**
 * @brief Complete aggregate of all drydock command-line options
 */
struct options {
    using path       = fs::path;
    using opt_path   = std::optional<fs::path>;
    using string     = std::string;
    using opt_string = std::optional<std::string>;

    options() noexcept;

    // The `--log-level` argument
    log::level log_level = log::level::info;
    // Any `--dry-run` argument
    bool dry_run = default_from_env("DRYDOCK_DRY_RUN", false);

    // The selected subcommand
    enum subcommand subcommand = cli::subcommand::_none_;

    // The `--project` directory, using the CWD as the default
    path project_dir = fs::current_path();
    // A `--file` naming the manifest. Overrides `--project`
    opt_path manifest_file;
    // A `--state-dir` overriding `<project>/.drydock`
    opt_path state_dir;
    // The `--deadline` duration string, applied to the whole invocation
    opt_string deadline;

    /**
     * @brief Parameters specific to 'drydock build'
     */
    struct {
        /// Targets named on the command line. Empty means every target.
        std::vector<string> targets;
    } build;

    struct {
        string suite;
    } test;

    struct {
        string pipeline;
    } run;

    /**
     * @brief Attach arguments and subcommands to the given argument parser, binding those arguments
     * to the values in this object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;

    static bool   default_from_env(string env_var, bool default_value) noexcept;
    static string default_from_env(string env_var, string default_value) noexcept;
};

}  // namespace cli
}  // namespace drydock
