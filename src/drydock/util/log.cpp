#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

using namespace drydock;

namespace {

spdlog::level::level_enum to_spdlog(log::level l, std::string_view msg) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
}

}  // namespace

void log::init_logger() noexcept {
    // Filtering happens before a message reaches spdlog, so spdlog itself lets everything through
    spdlog::set_level(spdlog::level::trace);
    spdlog::set_pattern("[%^%-5l%$] %v");
}

void log::log_print(log::level l, std::string_view msg) noexcept {
    spdlog::default_logger_raw()->log(to_spdlog(l, msg), "{}", msg);
}
