#include <drydock/cli/dispatch_main.hpp>
#include <drydock/cli/options.hpp>
#include <drydock/util/dym.hpp>
#include <drydock/util/env.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/signal.hpp>

#include <debate/debate.hpp>
#include <debate/enum.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <clocale>
#include <iostream>
#include <locale>
#include <optional>
#include <string>
#include <vector>

static void load_locale() {
    auto lang = drydock::getenv("LANG");
    if (!lang) {
        return;
    }
    try {
        std::locale::global(std::locale(*lang));
    } catch (const std::runtime_error& e) {
        // No locale with the given name
        return;
    }
}

int main_fn(std::string_view program_name, const std::vector<std::string_view>& argv) {
    drydock::log::init_logger();
    load_locale();
    std::setlocale(LC_CTYPE, ".utf8");

    drydock::cli::options   opts;
    debate::argument_parser parser{"Build, provision, and test a project as declared in its "
                                   "drydock.yaml"};
    opts.setup_parser(parser);

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request const&, debate::e_argument_parser p) {
            std::cout << p.parser.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument const& err,
            debate::e_argument_parser            p,
            debate::e_arg_spelling               arg) {
            std::cerr << p.parser.usage_string(program_name) << '\n';
            fmt::print(std::cerr, "{}: \"{}\"\n", err.what(), arg.spelling);
            std::vector<std::string_view> names;
            for (auto& sub : p.parser.subcommands()) {
                names.push_back(sub.name);
            }
            if (auto dym = drydock::did_you_mean(arg.spelling, names)) {
                fmt::print(std::cerr, "  (Did you mean '{}'?)\n", *dym);
            }
            return 2;
        },
        [&](debate::invalid_arguments const&,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val,
            debate::e_valid_values      valid) {
            std::cerr << p.parser.usage_string(program_name) << '\n';
            fmt::print(std::cerr,
                       "Invalid value '{}' given for '{}'. Expected one of: {}\n",
                       val.given,
                       spell.spelling,
                       fmt::join(valid.values, ", "));
            return 2;
        },
        [&](debate::invalid_arguments const& err,
            debate::e_argument_parser         p,
            debate::e_arg_spelling            spell,
            debate::e_invalid_arg_value       val) {
            std::cerr << p.parser.usage_string(program_name) << '\n';
            fmt::print(std::cerr,
                       "Invalid value '{}' given for '{}': {}\n",
                       val.given,
                       spell.spelling,
                       err.what());
            return 2;
        },
        [&](debate::missing_required const&,
            debate::e_argument_parser p,
            debate::e_argument        arg) {
            fmt::print(std::cerr,
                       "{}\nMissing required argument '{}'\n",
                       p.parser.usage_string(program_name),
                       arg.argument.preferred_spelling());
            return 2;
        },
        [&](debate::invalid_repetition const&,
            debate::e_argument_parser p,
            debate::e_arg_spelling    sp) {
            fmt::print(std::cerr,
                       "{}\nArgument '{}' cannot be provided more than once\n",
                       p.parser.usage_string(program_name),
                       sp.spelling);
            return 2;
        },
        [&](debate::invalid_arguments const& err,
            debate::e_argument_parser         p,
            debate::e_arg_spelling const*     sp) {
            fmt::print(std::cerr, "{}\nError: {}", p.parser.usage_string(program_name), err.what());
            if (sp) {
                fmt::print(std::cerr, " '{}'", sp->spelling);
            }
            std::cerr << '\n';
            return 2;
        });
    if (result) {
        // Non-null result from argument parsing, return that value immediately.
        return *result;
    }
    drydock::install_signal_handlers();
    drydock::log::current_log_level = opts.log_level;
    return drydock::cli::dispatch_main(opts);
}

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    return main_fn(argv[0], args);
}
