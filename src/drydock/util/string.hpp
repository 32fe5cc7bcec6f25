#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace drydock {

inline namespace string_utils {

inline std::string_view trim_view(std::string_view s) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

template <typename Range>
std::string joinstr(std::string_view joiner, Range&& rng) {
    std::string ret;
    bool        first = true;
    for (const auto& item : rng) {
        if (!first) {
            ret.append(joiner);
        }
        first = false;
        ret.append(std::string_view(item));
    }
    return ret;
}

}  // namespace string_utils

}  // namespace drydock
