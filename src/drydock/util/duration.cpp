#include "./duration.hpp"

#include "./string.hpp"

#include <drydock/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>

#include <charconv>

using namespace drydock;
using namespace std::chrono_literals;

std::chrono::milliseconds drydock::parse_duration(std::string_view given) {
    auto str = trim_view(given);

    auto bad = [&](std::string_view why) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>(
                                       "Invalid duration '{}': {}",
                                       given,
                                       why),
                                   e_duration_string{std::string(given)});
    };

    long long  count = 0;
    const auto first = str.data();
    const auto last  = str.data() + str.size();
    auto [ptr, ec]   = std::from_chars(first, last, count);
    if (ec != std::errc{} || ptr == first) {
        bad("Expected an integer, optionally followed by 'ms', 's', 'm', or 'h'");
    }
    if (count < 0) {
        bad("Durations may not be negative");
    }

    auto                      suffix = std::string_view(ptr, static_cast<std::size_t>(last - ptr));
    std::chrono::milliseconds unit   = 1ms;
    if (suffix == "s") {
        unit = 1s;
    } else if (suffix == "m") {
        unit = 1min;
    } else if (suffix == "h") {
        unit = 1h;
    } else if (!suffix.empty() && suffix != "ms") {
        bad(fmt::format("Unknown unit '{}'", suffix));
    }

    if (count > max_duration.count() / unit.count()) {
        bad(fmt::format("Durations may not exceed {}h",
                        std::chrono::duration_cast<std::chrono::hours>(max_duration).count()));
    }
    return unit * count;
}

std::string drydock::format_duration(std::chrono::milliseconds dur) {
    if (dur < 1s) {
        return fmt::format("{}ms", dur.count());
    }
    return fmt::format("{:.1f}s", static_cast<double>(dur.count()) / 1000.0);
}
