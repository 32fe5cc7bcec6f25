#pragma once

#include "./argument.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace debate {

/**
 * @brief The command-line spelling of an enumerator: underscores become hyphens
 */
inline std::string enum_value_spelling(std::string_view ident) {
    std::string ret{ident};
    std::ranges::replace(ret, '_', '-');
    return ret;
}

template <typename E>
auto make_enum_putter(E& dest) noexcept {
    return [&dest](std::string_view given, std::string_view spelling) {
        for (auto& [value, name] : magic_enum::enum_entries<E>()) {
            if (enum_value_spelling(name) == given) {
                dest = value;
                return;
            }
        }
        std::vector<std::string> valid;
        for (auto name : magic_enum::enum_names<E>()) {
            valid.push_back(enum_value_spelling(name));
        }
        BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value given for argument"),
                                   e_arg_spelling{std::string(spelling)},
                                   e_invalid_arg_value{std::string(given)},
                                   e_valid_values{std::move(valid)});
    };
}

}  // namespace debate
