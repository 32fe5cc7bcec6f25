#pragma once

#include <string_view>

namespace drydock {

/**
 * @brief Write a short error identifier to the file named by DRYDOCK_WRITE_ERROR_MARKER, if set.
 */
void write_error_marker(std::string_view) noexcept;

}  // namespace drydock
