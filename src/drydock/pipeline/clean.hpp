#pragma once

#include <filesystem>
#include <vector>

namespace drydock {

struct pipeline_context;
class project;

struct e_clean_path {
    std::filesystem::path value;
};

/**
 * @brief The paths removed by the clean stage: the manifest's `clean` paths followed by every
 * declared target output, resolved against the project root and without duplicates.
 *
 * Throws invalid_config_error if a path would remove the project root or anything outside of it.
 */
std::vector<std::filesystem::path> clean_paths_of(const project& proj);

/**
 * @brief Remove everything named by clean_paths_of(). Paths that do not exist are skipped. Returns
 * the number of paths that were removed.
 *
 * Throws clean_error if a path cannot be removed.
 */
int clean_project(const pipeline_context& ctx, const project& proj);

}  // namespace drydock
