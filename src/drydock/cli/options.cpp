#include "./options.hpp"

#include <drydock/util/env.hpp>

#include <debate/enum.hpp>
#include <magic_enum.hpp>

using namespace drydock;
using namespace debate;

namespace {

struct setup {
    drydock::cli::options& opts;

    explicit setup(drydock::cli::options& opts)
        : opts(opts) {}

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spelling  = "log-level",
            .short_spelling = 'l',
            .help           = "Set the drydock logging level. One of 'trace', 'debug', 'info', \n"
                              "'warn', 'error', 'critical', or 'silent'",
            .valname        = "<level>",
            .action         = put_into(opts.log_level),
        });
        parser.add_argument({
            .long_spelling  = "project",
            .short_spelling = 'p',
            .help    = "The project directory, containing drydock.yaml. Default is the working "
                       "directory",
            .valname = "<dir>",
            .action  = put_into(opts.project_dir),
        });
        parser.add_argument({
            .long_spelling  = "file",
            .short_spelling = 'f',
            .help    = "Path to the project manifest. The project root is the directory "
                       "containing it",
            .valname = "<manifest>",
            .action  = put_into(opts.manifest_file),
        });
        parser.add_argument({
            .long_spelling = "state-dir",
            .help          = "(Advanced) Directory for service lock files and logs. Default is "
                             "<project>/.drydock",
            .valname       = "<dir>",
            .action        = put_into(opts.state_dir),
        });
        parser.add_argument({
            .long_spelling = "deadline",
            .help    = "Give up, tearing down any services, once this much time has passed. "
                       "Given in milliseconds, or with a suffix of 'ms', 's', 'm', or 'h'",
            .valname = "<duration>",
            .action  = put_into(opts.deadline),
        });
        parser.add_argument({
            .long_spelling = "dry-run",
            .help          = "Print what would be done, but do not run any commands",
            .takes_value   = false,
            .action        = store_true(opts.dry_run),
        });

        setup_build_cmd(parser.add_subcommand("build",
                                              "Bring targets up-to-date",
                                              select(cli::subcommand::build)));
        parser.add_subcommand("clean",
                              "Remove the clean paths and every target output",
                              select(cli::subcommand::clean));
        setup_test_cmd(parser.add_subcommand("test",
                                             "Run a test suite, with the services it requires",
                                             select(cli::subcommand::test)));
        setup_run_cmd(parser.add_subcommand("run",
                                            "Run the stages of a pipeline",
                                            select(cli::subcommand::run)));
        parser.add_subcommand("ls",
                              "List the targets, services, suites, and pipelines of the project",
                              select(cli::subcommand::ls));
    }

    std::function<void()> select(cli::subcommand sub) {
        return [&o = opts, sub] { o.subcommand = sub; };
    }

    void setup_build_cmd(argument_parser& build_cmd) noexcept {
        build_cmd.add_argument({
            .help       = "Targets to build, along with their dependencies. If none are given, "
                          "every target is built",
            .valname    = "<target>",
            .can_repeat = true,
            .action     = push_back_onto(opts.build.targets),
        });
    }

    void setup_test_cmd(argument_parser& test_cmd) noexcept {
        test_cmd.add_argument({
            .help     = "The name of the test suite to run",
            .valname  = "<suite>",
            .required = true,
            .action   = put_into(opts.test.suite),
        });
    }

    void setup_run_cmd(argument_parser& run_cmd) noexcept {
        run_cmd.add_argument({
            .help     = "The name of the pipeline to run",
            .valname  = "<pipeline>",
            .required = true,
            .action   = put_into(opts.run.pipeline),
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}

bool cli::options::default_from_env(std::string key, bool def) noexcept {
    auto env = drydock::getenv(key);
    if (env.has_value()) {
        return is_truthy_string(*env);
    }
    return def;
}

std::string cli::options::default_from_env(std::string key, std::string def) noexcept {
    return drydock::getenv(key).value_or(def);
}

cli::options::options() noexcept {
    auto ll = drydock::getenv("DRYDOCK_LOG_LEVEL");
    if (ll.has_value()) {
        auto llo = magic_enum::enum_cast<log::level>(*ll);
        if (llo.has_value()) {
            log_level = *llo;
        }
    }

    if (auto dir = drydock::getenv("DRYDOCK_PROJECT_DIR")) {
        project_dir = *dir;
    }
    if (auto dir = drydock::getenv("DRYDOCK_STATE_DIR")) {
        state_dir = *dir;
    }
    deadline = drydock::getenv("DRYDOCK_DEADLINE");
}
