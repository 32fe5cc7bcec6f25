#include "./debate.hpp"

#include "./enum.hpp"

#include <boost/leaf.hpp>
#include <catch2/catch.hpp>

namespace {

enum class verbosity {
    quiet,
    normal,
    very_loud,
};

}  // namespace

TEST_CASE("Parse options and positionals") {
    verbosity                level = verbosity::normal;
    std::string              file;
    std::vector<std::string> extra;
    int                      jobs = 0;
    bool                     dry  = false;

    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .long_spelling  = "verbosity",
        .short_spelling = 'v',
        .help           = "How loud to be",
        .valname        = "<level>",
        .action         = debate::put_into(level),
    });
    parser.add_argument(debate::argument{
        .long_spelling  = "jobs",
        .short_spelling = 'j',
        .action         = debate::put_into(jobs),
    });
    parser.add_argument(debate::argument{
        .long_spelling  = "dry-run",
        .short_spelling = 'n',
        .takes_value    = false,
        .action         = debate::store_true(dry),
    });
    parser.add_argument(debate::argument{
        .valname  = "<file>",
        .required = true,
        .action   = debate::put_into(file),
    });
    parser.add_argument(debate::argument{
        .valname    = "<extra>",
        .can_repeat = true,
        .action     = debate::push_back_onto(extra),
    });

    parser.parse_argv({"--verbosity=quiet", "a.txt"});
    CHECK(level == verbosity::quiet);
    CHECK(file == "a.txt");

    parser.parse_argv({"--verbosity", "very-loud", "b.txt"});
    CHECK(level == verbosity::very_loud);

    parser.parse_argv({"-vnormal", "-j4", "c.txt"});
    CHECK(level == verbosity::normal);
    CHECK(jobs == 4);

    parser.parse_argv({"-nj", "8", "d.txt", "x", "y", "--", "-z"});
    CHECK(dry);
    CHECK(jobs == 8);
    CHECK(file == "d.txt");
    CHECK(extra == std::vector<std::string>{"x", "y", "-z"});

    CHECK_THROWS_AS(parser.parse_argv({"-vquiet", "--verbosity=quiet", "e.txt"}),
                    debate::invalid_repetition);
    CHECK_THROWS_AS(parser.parse_argv({"--jobs=many", "e.txt"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--dry-run=yes", "e.txt"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--jobs"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--frobnicate", "e.txt"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"--help"}), debate::help_request);
    CHECK_THROWS_AS(parser.parse_argv({"-h"}), debate::help_request);
}

TEST_CASE("Invalid enum values list the valid ones") {
    verbosity               level = verbosity::normal;
    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .long_spelling = "verbosity",
        .action        = debate::put_into(level),
    });

    boost::leaf::try_catch(
        [&] {
            parser.parse_argv({"--verbosity=very_loud"});
            FAIL("Expected an error");
        },
        [](const debate::invalid_arguments&,
           debate::e_arg_spelling      spell,
           debate::e_invalid_arg_value val,
           debate::e_valid_values      valid) {
            CHECK(spell.spelling == "--verbosity");
            CHECK(val.given == "very_loud");
            CHECK(valid.values == std::vector<std::string>{"quiet", "normal", "very-loud"});
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}

TEST_CASE("Subcommands") {
    std::string              selected;
    std::vector<std::string> targets;
    bool                     dry = false;

    debate::argument_parser parser{"Build things"};
    parser.add_argument(debate::argument{
        .long_spelling = "dry-run",
        .takes_value   = false,
        .action        = debate::store_true(dry),
    });
    auto& build = parser.add_subcommand("build", "Build targets", [&] { selected = "build"; });
    build.add_argument(debate::argument{
        .valname    = "<target>",
        .can_repeat = true,
        .action     = debate::push_back_onto(targets),
    });
    parser.add_subcommand("clean", "Remove outputs", [&] { selected = "clean"; });

    parser.parse_argv({"build", "a", "b"});
    CHECK(selected == "build");
    CHECK(targets == std::vector<std::string>{"a", "b"});
    CHECK_FALSE(dry);

    // Options of the parent are accepted after the subcommand
    parser.parse_argv({"clean", "--dry-run"});
    CHECK(selected == "clean");
    CHECK(dry);

    CHECK_THROWS_AS(parser.parse_argv({}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"bulid"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"clean", "extra"}), debate::unrecognized_argument);

    CHECK_THAT(parser.usage_string("drydock"), Catch::Contains("{build,clean}"));
    CHECK_THAT(build.usage_string("drydock"), Catch::Contains("drydock build [<target> [...]]"));
    CHECK_THAT(parser.help_string("drydock"), Catch::Contains("Remove outputs"));
}
