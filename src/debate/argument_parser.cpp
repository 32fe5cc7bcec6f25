#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <set>

using namespace debate;

namespace {

class parse_engine {
    const std::vector<std::string_view>& _args;
    std::size_t                          _pos = 0;

    // The innermost parser of the subcommands given so far
    const argument_parser* _bottom;
    std::size_t            _positional_index = 0;

    std::set<const argument*> _seen{};

    std::string_view _current() const noexcept { return _args[_pos]; }
    bool             _at_end() const noexcept { return _pos == _args.size(); }

    void _see(const argument& arg) {
        if (!_seen.insert(&arg).second && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Argument was given more than once"));
        }
    }

    // Options of enclosing parsers are also accepted
    template <typename Pred>
    const argument* _find_option(Pred&& pred) const {
        for (auto p = _bottom; p; p = p->parent()) {
            for (auto& arg : p->arguments()) {
                if (!arg.is_positional() && pred(arg)) {
                    return &arg;
                }
            }
        }
        return nullptr;
    }

    std::string_view _take_value() {
        if (_at_end()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value for argument"));
        }
        return _args[_pos++];
    }

    void _parse_long(std::string_view given) {
        auto body = given.substr(2);
        if (body == "help") {
            throw help_request();
        }
        std::optional<std::string_view> inline_value;
        auto                            eq = body.find('=');
        if (eq != body.npos) {
            inline_value = body.substr(eq + 1);
            body         = body.substr(0, eq);
        }
        auto arg = _find_option([&](const argument& a) { return a.long_spelling == body; });
        if (!arg) {
            BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                       e_arg_spelling{std::string(given)});
        }
        ++_pos;
        auto spelling = "--" + std::string(body);
        auto _        = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});
        _see(*arg);
        if (!arg->takes_value) {
            if (inline_value) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Argument does not take a value"),
                                           e_invalid_arg_value{std::string(*inline_value)});
            }
            arg->action("", spelling);
        } else if (inline_value) {
            arg->action(*inline_value, spelling);
        } else {
            arg->action(_take_value(), spelling);
        }
    }

    // Switches may be grouped, as in `-abc`. A value may follow directly, as in `-lDEBUG`.
    void _parse_short(std::string_view given) {
        auto tail = given.substr(1);
        if (tail == "h") {
            throw help_request();
        }
        ++_pos;
        while (!tail.empty()) {
            auto c        = tail.front();
            auto spelling = std::string{'-', c};
            auto arg = _find_option([&](const argument& a) { return a.short_spelling == c; });
            if (!arg) {
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                           e_arg_spelling{spelling});
            }
            auto _ = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});
            _see(*arg);
            tail.remove_prefix(1);
            if (!arg->takes_value) {
                arg->action("", spelling);
                continue;
            }
            arg->action(tail.empty() ? _take_value() : tail, spelling);
            return;
        }
    }

    bool _try_positional(std::string_view given) {
        std::size_t idx = 0;
        for (auto& arg : _bottom->arguments()) {
            if (!arg.is_positional() || idx++ != _positional_index) {
                continue;
            }
            auto spelling = arg.preferred_spelling();
            auto _        = boost::leaf::on_error(e_argument{arg}, e_arg_spelling{spelling});
            _see(arg);
            arg.action(given, spelling);
            // A repeatable positional takes every remaining positional value
            if (!arg.can_repeat) {
                ++_positional_index;
            }
            ++_pos;
            return true;
        }
        return false;
    }

    bool _try_subcommand(std::string_view given) {
        for (auto& sub : _bottom->subcommands()) {
            if (sub.name != given) {
                continue;
            }
            if (sub.on_select) {
                sub.on_select();
            }
            _bottom           = sub.parser.get();
            _positional_index = 0;
            ++_pos;
            return true;
        }
        return false;
    }

    void _finalize() {
        for (auto p = _bottom; p; p = p->parent()) {
            for (auto& arg : p->arguments()) {
                if (arg.required && !_seen.contains(&arg)) {
                    BOOST_LEAF_THROW_EXCEPTION(missing_required("Required argument is missing"),
                                               e_argument{arg},
                                               e_arg_spelling{arg.preferred_spelling()});
                }
            }
        }
        if (!_bottom->subcommands().empty() && _bottom->subcommand_required()) {
            BOOST_LEAF_THROW_EXCEPTION(missing_required("Expected a subcommand"));
        }
    }

public:
    parse_engine(const std::vector<std::string_view>& args, const argument_parser& root)
        : _args(args)
        , _bottom(&root) {}

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{*_bottom}; });

        bool only_positionals = false;
        while (!_at_end()) {
            auto given = _current();
            if (!only_positionals && given == "--") {
                only_positionals = true;
                ++_pos;
                continue;
            }
            if (!only_positionals && given.size() > 1 && given[0] == '-') {
                if (given[1] == '-') {
                    _parse_long(given);
                } else {
                    _parse_short(given);
                }
                continue;
            }
            if (_try_positional(given) || (!only_positionals && _try_subcommand(given))) {
                continue;
            }
            BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument(_bottom->subcommands().empty()
                                                                 ? "Unexpected argument"
                                                                 : "Unknown subcommand"),
                                       e_arg_spelling{std::string(given)});
        }
        _finalize();
    }
};

}  // namespace

void argument_parser::_parse(const std::vector<std::string_view>& args) const {
    parse_engine{args, *this}.run();
}

argument& argument_parser::add_argument(argument arg) {
    return _arguments.emplace_back(std::move(arg));
}

argument_parser& argument_parser::add_subcommand(std::string           name,
                                                 std::string           help,
                                                 std::function<void()> on_select) {
    auto parser     = std::make_unique<argument_parser>(name, help);
    parser->_parent = this;
    auto& sub       = _subcommands.emplace_back(subcommand{
        .name      = std::move(name),
        .help      = std::move(help),
        .on_select = std::move(on_select),
        .parser    = std::move(parser),
    });
    return *sub.parser;
}

std::string argument_parser::usage_string(std::string_view progname) const {
    std::string chain;
    for (auto p = this; p; p = p->parent()) {
        if (!p->name().empty()) {
            chain = " " + p->name() + chain;
        }
    }
    auto ret    = fmt::format("Usage: {}{}", progname, chain);
    auto indent = std::min<std::size_t>(ret.size(), 24);
    auto col    = ret.size();

    auto append_wrapped = [&](const std::string& item) {
        if (col + item.size() + 1 > 79 && col > indent) {
            ret.append("\n");
            ret.append(indent, ' ');
            col = indent;
        }
        ret.append(" " + item);
        col += item.size() + 1;
    };

    for (auto& arg : _arguments) {
        append_wrapped(arg.syntax_string());
    }
    if (!_subcommands.empty()) {
        std::vector<std::string_view> names;
        for (auto& sub : _subcommands) {
            names.push_back(sub.name);
        }
        append_wrapped(fmt::format("{{{}}}", fmt::join(names, ",")));
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const {
    auto ret = usage_string(progname) + "\n\n";
    if (!_description.empty()) {
        ret.append(_description + "\n\n");
    }

    auto list_args = [&](std::string_view heading, bool positional) {
        bool any = false;
        for (auto& arg : _arguments) {
            if (arg.is_positional() != positional) {
                continue;
            }
            if (!any) {
                ret.append(fmt::format("{}:\n\n", heading));
                any = true;
            }
            ret.append(arg.help_string() + "\n");
        }
    };
    list_args("Positional arguments", true);
    list_args("Options", false);

    if (!_subcommands.empty()) {
        ret.append("Subcommands:\n\n");
        for (auto& sub : _subcommands) {
            ret.append(fmt::format(fmt::emphasis::bold, "{}", sub.name));
            ret.append(fmt::format("\n    {}\n\n", sub.help));
        }
    }
    return ret;
}
