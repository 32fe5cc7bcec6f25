#pragma once

#include "./project.hpp"

#include <drydock/graph/executor.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace drydock {

struct pipeline_context;
class service_runtime;

struct e_pipeline_name {
    std::string value;
};

/// The stage of a pipeline that failed. `index` counts from one.
struct e_pipeline_stage {
    int         index;
    std::string description;
};

/**
 * @brief Create the context for a run of the given project: rooted at the project directory, with
 * the manifest's environment.
 */
pipeline_context make_pipeline_context(const project& proj);

/**
 * @brief Runs the stages of a project: clean, build, and test.
 *
 * Every stage throws on failure. Pipelines are fail-fast: the first failing stage aborts the rest,
 * and the error carries an e_pipeline_stage identifying it.
 */
class driver {
    const project&    _proj;
    pipeline_context& _ctx;
    service_runtime&  _runtime;

public:
    driver(const project& proj, pipeline_context& ctx, service_runtime& runtime)
        : _proj(proj)
        , _ctx(ctx)
        , _runtime(runtime) {}

    /**
     * @brief Bring the named targets (or every target, if none are named) up-to-date.
     *
     * Throws action_execution_error if an action fails.
     */
    build_report build(const std::vector<std::string>& targets);

    /// Remove the clean paths and the target outputs. Returns the number of paths removed.
    int clean();

    /// Run the named test suite with its services
    execution_result test(std::string_view suite);

    void run_stage(const pipeline_stage&);

    /**
     * @brief Run every stage of the named pipeline, in order.
     *
     * The pipeline's `timeout` tightens the context deadline. The deadline is checked before each
     * stage.
     */
    void run_pipeline(std::string_view name);
};

}  // namespace drydock
