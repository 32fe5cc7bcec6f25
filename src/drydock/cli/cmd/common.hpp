#pragma once

#include <drydock/context.hpp>
#include <drydock/pipeline/project.hpp>

namespace drydock::cli {

struct options;

/**
 * @brief Load the project named by `--file`, or the one in the `--project` directory.
 */
project load_project(const options& opts);

/**
 * @brief Create the context for running `proj` with the global options applied: the state
 * directory, the deadline, and dry-run.
 */
pipeline_context make_context(const options& opts, const project& proj);

}  // namespace drydock::cli
