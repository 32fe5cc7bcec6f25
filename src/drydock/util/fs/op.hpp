#pragma once

#include <filesystem>
#include <optional>

namespace drydock {

using path_ref = const std::filesystem::path&;

/**
 * @brief Check whether a file exists. Throws if the check itself fails (e.g. permissions).
 */
[[nodiscard]] bool file_exists(path_ref);

/**
 * @brief Obtain the modification time of a file, or nullopt if it does not exist.
 */
[[nodiscard]] std::optional<std::filesystem::file_time_type> file_mtime(path_ref);

/**
 * @brief Remove a file or directory tree. Returns `true` if anything was removed.
 */
bool remove_all_if_exists(path_ref);

void ensure_parent_dirs(path_ref);

}  // namespace drydock
