#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace drydock {

/// Attached to a std::system_error thrown while reading or writing a file
struct e_file_io {
    std::filesystem::path path;
    std::string_view      action;
};

/// Replace the contents of `path`
void write_file(const std::filesystem::path& path, std::string_view content);

[[nodiscard]] std::string read_file(const std::filesystem::path& path);

}  // namespace drydock
