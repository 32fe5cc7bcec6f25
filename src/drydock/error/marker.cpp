#include "./marker.hpp"

#include <drydock/util/env.hpp>
#include <drydock/util/fs/io.hpp>
#include <drydock/util/log.hpp>

void drydock::write_error_marker(std::string_view error) noexcept {
    drydock_log(trace, "[error marker {}]", error);
    auto efile_path = drydock::getenv("DRYDOCK_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    drydock_log(trace, "[error marker written to [{}]]", *efile_path);
    try {
        drydock::write_file(*efile_path, error);
    } catch (const std::exception& e) {
        drydock_log(warn, "Failed to write error marker [{}]: {}", *efile_path, e.what());
    }
}
