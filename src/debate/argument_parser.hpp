#pragma once

#include "./argument.hpp"

#include <functional>
#include <initializer_list>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

struct subcommand;

/**
 * @brief A set of arguments, and optionally a set of subcommands each with arguments of their own.
 *
 * Options of a parser remain valid after one of its subcommands has been given, so global options
 * may appear anywhere on the command line.
 */
class argument_parser {
    std::string            _name;
    std::string            _description;
    const argument_parser* _parent = nullptr;

    std::list<argument>   _arguments;
    std::list<subcommand> _subcommands;
    bool                  _subcommand_required = true;

    void _parse(const std::vector<std::string_view>& args) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    argument_parser(std::string name, std::string description)
        : _name(std::move(name))
        , _description(std::move(description)) {}

    argument_parser(const argument_parser&) = delete;
    argument_parser& operator=(const argument_parser&) = delete;

    argument& add_argument(argument arg);

    /**
     * @brief Add a subcommand. `on_select` is called when the subcommand is given. Returns the
     * parser for the subcommand's own arguments.
     */
    argument_parser&
    add_subcommand(std::string name, std::string help, std::function<void()> on_select);

    void set_subcommand_required(bool b) noexcept { _subcommand_required = b; }
    bool subcommand_required() const noexcept { return _subcommand_required; }

    const std::string&           name() const noexcept { return _name; }
    const argument_parser*       parent() const noexcept { return _parent; }
    const std::list<argument>&   arguments() const noexcept { return _arguments; }
    const std::list<subcommand>& subcommands() const noexcept { return _subcommands; }

    std::string usage_string(std::string_view progname) const;
    std::string help_string(std::string_view progname) const;

    /**
     * @brief Parse the given arguments (not including the program name), invoking the actions of
     * the arguments that are given.
     *
     * Throws help_request for `--help` or `-h`, and an invalid_arguments exception if the
     * arguments are not acceptable.
     */
    void parse_argv(const std::vector<std::string_view>& args) const { _parse(args); }
    void parse_argv(std::initializer_list<std::string_view> args) const {
        _parse(std::vector<std::string_view>(args));
    }
};

struct subcommand {
    std::string           name;
    std::string           help;
    std::function<void()> on_select;

    std::unique_ptr<argument_parser> parser;
};

}  // namespace debate
