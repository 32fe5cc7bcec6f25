#include "./nonesuch.hpp"

#include <drydock/util/log.hpp>

#include <iomanip>
#include <ostream>

using namespace drydock;

void e_nonesuch::log_error(std::string_view fmt) const noexcept {
    drydock_log(error, fmt, given);
    if (nearest) {
        drydock_log(error, "  (Did you mean '{}'?)", *nearest);
    }
}

void e_nonesuch::ostream_into(std::ostream& out) const noexcept {
    out << "drydock::e_nonesuch: Given " << std::quoted(given);
    if (nearest.has_value()) {
        out << " (nearest is " << std::quoted(*nearest) << ")";
    }
}
