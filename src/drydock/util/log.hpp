#pragma once

#include <fmt/format.h>

#include <string_view>

namespace drydock::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

template <typename T>
concept formattable = fmt::is_formattable<T>::value;

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        try {
            auto message = fmt::vformat(s, fmt::make_format_args(args...));
            log_print(l, message);
        } catch (const fmt::format_error& e) {
            log_print(level::critical, e.what());
            log_print(l, s);
        }
    }
}

#define drydock_log(Level, str, ...)                                                               \
    do {                                                                                           \
        if (int(drydock::log::level::Level) >= int(drydock::log::current_log_level)) {             \
            ::drydock::log::log(::drydock::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                          \
    } while (0)

}  // namespace drydock::log
