#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace drydock {

/**
 * @brief Get the short revision of the checkout at `dir` from `git rev-parse --short HEAD`.
 *
 * Returns nullopt if git is unavailable or `dir` is not in a repository.
 */
std::optional<std::string> query_vcs_label(const std::filesystem::path& dir);

}  // namespace drydock
