#include "./error_handler.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/error/marker.hpp>
#include <drydock/error/nonesuch.hpp>
#include <drydock/pipeline/driver.hpp>
#include <drydock/pipeline/project.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/signal.hpp>
#include <drydock/util/fs/io.hpp>
#include <drydock/util/yaml/parse.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <filesystem>

using namespace drydock;

namespace {

/// The error marker for an error: the name of its reference page
std::string marker_for(const error_base& exc) {
    return std::filesystem::path(exc.error_reference()).stem().string();
}

void log_pipeline_context(const e_pipeline_name* pipeline, const e_pipeline_stage* stage) {
    if (pipeline && stage) {
        drydock_log(error,
                    "  (In stage {} ({}) of pipeline '{}')",
                    stage->index,
                    stage->description,
                    pipeline->value);
    } else if (pipeline) {
        drydock_log(error, "  (While running pipeline '{}')", pipeline->value);
    }
}

auto handlers = std::tuple(  //
    [](const invalid_config_error&   exc,
       e_yaml_parse_error            err,
       const e_parse_yaml_file_path* fpath) {
        drydock_log(error, "Invalid YAML in the project manifest: {}", err.value);
        if (fpath) {
            drydock_log(error, "  (While reading [{}])", fpath->value.string());
        }
        drydock_log(debug, "{}", exc.what());
        write_error_marker("manifest-yaml-parse-error");
        return 1;
    },
    [](e_bad_manifest_key badkey, e_manifest_key key, const e_manifest_path* manifest) {
        if (manifest) {
            drydock_log(error,
                        "Error loading the project manifest [{}]",
                        manifest->value.string());
        }
        badkey.log_error("Unknown manifest property '{}'");
        drydock_log(error, "  (At `{}`)", key.value);
        write_error_marker("unknown-manifest-key");
        return 1;
    },
    [](const user_cancelled&) {
        drydock_log(critical, "Operation cancelled by the user");
        return 2;
    },
    [](const error_base&                           exc,
       boost::leaf::verbose_diagnostic_info const& diag,
       const e_nonesuch*                           missing,
       const e_manifest_path*                      manifest,
       const e_pipeline_name*                      pipeline,
       const e_pipeline_stage*                     stage) {
        drydock_log(error, "{}", exc.what());
        if (missing && missing->nearest) {
            drydock_log(error, "  (Did you mean '{}'?)", *missing->nearest);
        }
        if (manifest) {
            drydock_log(error,
                        "  (While loading the project manifest [{}])",
                        manifest->value.string());
        }
        log_pipeline_context(pipeline, stage);
        drydock_log(error, "{}", exc.explanation());
        drydock_log(error, "Refer: {}", exc.error_reference());
        drydock_log(debug, "Additional diagnostic details:\n{}", fmt::streamed(diag));
        write_error_marker(marker_for(exc));
        return 1;
    },
    [](const std::system_error& exc, e_file_io io) {
        drydock_log(error, "Error while {} [{}]: {}", io.action, io.path.string(), exc.what());
        write_error_marker("file-io-error");
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        drydock_log(critical,
                    "An unhandled std::system_error arose. THIS IS A DRYDOCK BUG! Info: {}",
                    fmt::streamed(diag));
        drydock_log(critical,
                    "Exception message from std::system_error: {}",
                    exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        drydock_log(critical,
                    "An unhandled error arose. THIS IS A DRYDOCK BUG! Info: {}",
                    fmt::streamed(diag));
        return 42;
    });

}  // namespace

int drydock::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
