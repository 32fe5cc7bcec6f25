#include "./argument.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

using namespace debate;

std::string argument::preferred_spelling() const {
    if (!long_spelling.empty()) {
        return "--" + long_spelling;
    } else if (short_spelling) {
        return std::string{'-', *short_spelling};
    }
    return valname;
}

std::string argument::syntax_string() const {
    auto val = valname.empty() ? std::string("<value>") : valname;
    if (is_positional()) {
        auto ret = can_repeat ? fmt::format("{} [...]", val) : val;
        return required ? ret : fmt::format("[{}]", ret);
    }
    auto spelled = preferred_spelling();
    if (takes_value) {
        spelled += (long_spelling.empty() ? " " : "=") + val;
    }
    if (can_repeat) {
        spelled += " [...]";
    }
    return required ? spelled : fmt::format("[{}]", spelled);
}

std::string argument::help_string() const {
    std::string ret;
    auto        val = valname.empty() ? std::string("<value>") : valname;
    if (is_positional()) {
        ret = fmt::format(fmt::emphasis::bold, "{}", val);
    } else {
        std::vector<std::string> spellings;
        if (!long_spelling.empty()) {
            spellings.push_back(fmt::format(fmt::emphasis::bold, "--{}", long_spelling)
                                + (takes_value ? "=" + val : ""));
        }
        if (short_spelling) {
            spellings.push_back(fmt::format(fmt::emphasis::bold, "-{}", *short_spelling)
                                + (takes_value ? " " + val : ""));
        }
        ret = fmt::format("{}", fmt::join(spellings, ", "));
    }
    ret.append("\n");
    // Indent every line of the help text
    ret.append("    ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append("    ");
        }
    }
    ret.push_back('\n');
    return ret;
}
