#include "./shlex.hpp"

#include "./string.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

using namespace drydock;

std::vector<std::string> drydock::split_shell_string(std::string_view shell) {
    char cur_quote  = 0;
    bool is_escaped = false;

    std::vector<std::string>   acc;
    std::optional<std::string> token;

    auto append = [&](char c) {
        if (!token) {
            token.emplace();
        }
        token->push_back(c);
    };

    for (const char c : shell) {
        if (is_escaped) {
            is_escaped = false;
            if (c == '\n') {
                // Line continuation
                continue;
            }
            if (cur_quote == '"' && c != '"' && c != '\\' && c != '$' && c != '`') {
                // Inside double quotes only a few characters are escapable
                append('\\');
            }
            append(c);
        } else if (c == '\\' && cur_quote != '\'') {
            is_escaped = true;
        } else if (cur_quote) {
            if (c == cur_quote) {
                cur_quote = 0;
            } else {
                append(c);
            }
        } else if (c == '"' || c == '\'') {
            cur_quote = c;
            if (!token) {
                token.emplace();
            }
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (token) {
                acc.push_back(std::move(*token));
                token.reset();
            }
        } else {
            append(c);
        }
    }

    if (token) {
        acc.push_back(std::move(*token));
    }
    return acc;
}

bool drydock::needs_quoting(std::string_view s) {
    if (s.empty()) {
        return true;
    }
    std::string_view okay_chars = "@%-+=:,./_";
    return !std::all_of(s.begin(), s.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || okay_chars.find(c) != okay_chars.npos;
    });
}

std::string drydock::quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    return "'" + replace(s, "'", R"('\'')") + "'";
}
