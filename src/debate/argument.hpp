#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>

#include <charconv>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

/**
 * @brief Receives the value of an argument, and the spelling it was given with
 */
using argument_action = std::function<void(std::string_view value, std::string_view spelling)>;

template <typename E>
auto make_enum_putter(E& dest) noexcept;

template <typename Int>
auto make_integer_putter(Int& dest) noexcept {
    return [&dest](std::string_view value, std::string_view spelling) {
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), dest);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected an integer"),
                                       e_arg_spelling{std::string(spelling)},
                                       e_invalid_arg_value{std::string(value)});
        }
    };
}

/// Store the given value in `dest`, converting as needed
constexpr inline auto put_into = [](auto& dest) -> argument_action {
    using T = std::remove_cvref_t<decltype(dest)>;
    if constexpr (std::is_enum_v<T>) {
        // Include <debate/enum.hpp> for enum-typed destinations
        return make_enum_putter(dest);
    } else if constexpr (std::is_integral_v<T>) {
        return make_integer_putter(dest);
    } else {
        return [&dest](std::string_view value, std::string_view) { dest = T(value); };
    }
};

/// Store a fixed value in `dest`, ignoring the value given
constexpr inline auto store_value = [](auto& dest, auto val) -> argument_action {
    return [&dest, val](std::string_view, std::string_view) { dest = val; };
};

constexpr inline auto store_true = [](auto& dest) { return store_value(dest, true); };

/// Append each given value to the container `dest`
constexpr inline auto push_back_onto = [](auto& dest) -> argument_action {
    return [&dest](std::string_view value, std::string_view) { dest.emplace_back(value); };
};

/**
 * @brief A command-line argument. Arguments without a long or a short spelling are positional.
 */
struct argument {
    /// Spelled `--<long_spelling>`, followed by `=value` or by the value as the next argument
    std::string long_spelling{};
    /// Spelled `-<short_spelling>`, followed by the value directly or as the next argument
    std::optional<char> short_spelling{};

    std::string help{};
    std::string valname{};

    bool required = false;
    /// If false, this is a switch and `action` receives an empty value
    bool takes_value = true;
    /// May be given more than once. A repeatable positional takes all remaining positionals.
    bool can_repeat = false;

    argument_action action{};

    bool is_positional() const noexcept { return long_spelling.empty() && !short_spelling; }

    /// `--long`, `-s`, or the value name for positionals
    std::string preferred_spelling() const;

    /// How this argument appears in a usage string, e.g. `[--log-level=<level>]`
    std::string syntax_string() const;

    /// The entry for this argument in the help listing
    std::string help_string() const;
};

}  // namespace debate
