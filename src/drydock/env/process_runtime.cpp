#include "./process_runtime.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/shlex.hpp>
#include <drydock/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>

#include <filesystem>

using namespace drydock;
using namespace std::chrono_literals;

namespace {

constexpr auto background_stop_grace = 10s;

void log_output(std::string_view name, const proc_result& res) {
    auto out = trim_view(res.output);
    if (!out.empty()) {
        drydock_log(error, "Output from service [{}]:\n{}", name, out);
    }
}

}  // namespace

std::vector<std::string> drydock::default_container_cli() {
    auto cli = split_shell_string(drydock::getenv("DRYDOCK_CONTAINER_RUNTIME", [] {
        return "docker";
    }));
    if (cli.empty()) {
        cli.push_back("docker");
    }
    return cli;
}

std::vector<std::string> drydock::container_run_command(const std::vector<std::string>& cli,
                                                        const service_spec&             spec) {
    neo_assert(expects, spec.image.has_value(), "Service has no container image", spec.name);
    auto& img = *spec.image;
    auto  cmd = cli;
    cmd.insert(cmd.end(), {"run", "--name", spec.name});
    for (auto& [key, value] : spec.env) {
        cmd.push_back("-e");
        cmd.push_back(key + "=" + value);
    }
    for (auto& port : img.ports) {
        cmd.push_back("-p");
        cmd.push_back(port);
    }
    cmd.insert(cmd.end(), img.run_args.begin(), img.run_args.end());
    cmd.push_back("-d");
    cmd.push_back(img.image);
    cmd.insert(cmd.end(), img.command.begin(), img.command.end());
    return cmd;
}

std::vector<std::string> drydock::container_rm_command(const std::vector<std::string>& cli,
                                                       const service_spec&             spec) {
    auto cmd = cli;
    cmd.insert(cmd.end(), {"rm", "-f", spec.name});
    return cmd;
}

std::optional<std::vector<std::string>>
process_runtime::_start_command(const service_spec& spec) const {
    if (spec.image) {
        return container_run_command(_container_cli, spec);
    } else if (spec.start) {
        return shell_command(*spec.start);
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>>
process_runtime::_stop_command(const service_spec& spec) const {
    if (spec.stop) {
        return shell_command(*spec.stop);
    } else if (spec.image) {
        return container_rm_command(_container_cli, spec);
    }
    return std::nullopt;
}

proc_options process_runtime::_options_for(const service_spec&      spec,
                                           const pipeline_context& ctx) const {
    proc_options opts;
    opts.cwd = spec.cwd ? (ctx.project_root / *spec.cwd).lexically_normal() : ctx.project_root;
    opts.env = ctx.subprocess_env();
    if (!spec.image) {
        // Image services get their environment through `-e` instead
        opts.env = merge_env(std::move(opts.env), spec.env);
    }
    return opts;
}

void process_runtime::start(const service_spec& spec, const pipeline_context& ctx) {
    auto start_cmd = _start_command(spec);
    if (!start_cmd) {
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::service_start_failed>(
                                       "Service '{}' has neither a start command nor an image",
                                       spec.name),
                                   e_service_name{spec.name});
    }

    if (spec.cleanup_before_start || spec.image) {
        if (auto stop_cmd = _stop_command(spec)) {
            drydock_log(debug, "Removing any leftover instance of service [{}]", spec.name);
            auto opts    = _options_for(spec, ctx);
            opts.command = *stop_cmd;
            opts.timeout = ctx.bound_timeout(60s);
            auto res     = run_proc(opts);
            drydock_log(trace, "Pre-start cleanup of [{}] {}", spec.name, res.describe());
        }
    }

    auto opts    = _options_for(spec, ctx);
    opts.command = *start_cmd;

    if (spec.background) {
        std::filesystem::create_directories(ctx.state_dir / "services");
        opts.output_file = ctx.state_dir / "services" / (spec.name + ".log");
        drydock_log(debug,
                    "Service [{}] output is written to [{}]",
                    spec.name,
                    opts.output_file->string());
        _background.insert_or_assign(spec.name, child_process::spawn(opts));
        return;
    }

    opts.timeout = ctx.bound_timeout(std::nullopt);
    auto res     = run_proc(opts);
    if (!res.okay()) {
        log_output(spec.name, res);
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::service_start_failed>(
                                       "Service '{}' failed to start: `{}` {}",
                                       spec.name,
                                       quote_command(*start_cmd),
                                       res.describe()),
                                   e_service_name{spec.name});
    }
    drydock_log(trace, "Service [{}] start output: {}", spec.name, res.output);
}

bool process_runtime::probe(const service_spec&       spec,
                            const pipeline_context&   ctx,
                            std::chrono::milliseconds timeout) {
    if (auto bg = _background.find(spec.name); bg != _background.end()) {
        if (auto exited = bg->second.try_wait()) {
            BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::service_start_failed>(
                                           "Service '{}' {} before it became ready",
                                           spec.name,
                                           exited->describe()),
                                       e_service_name{spec.name});
        }
    }

    if (!spec.ready.command) {
        return true;
    }
    auto opts    = _options_for(spec, ctx);
    opts.command = shell_command(*spec.ready.command);
    opts.timeout = timeout;
    auto res     = run_proc(opts);
    drydock_log(trace, "Readiness check for [{}] {}", spec.name, res.describe());
    return res.okay();
}

void process_runtime::stop(const service_spec& spec, const pipeline_context& ctx) {
    std::optional<proc_result> failure;
    std::string                failed_cmd;

    if (auto stop_cmd = _stop_command(spec)) {
        auto opts        = _options_for(spec, ctx);
        opts.command     = *stop_cmd;
        opts.timeout     = 5min;
        opts.cancellable = false;
        auto res         = run_proc(opts);
        if (!res.okay()) {
            failure    = res;
            failed_cmd = quote_command(*stop_cmd);
        }
    }

    if (auto bg = _background.find(spec.name); bg != _background.end()) {
        if (!bg->second.try_wait()) {
            bg->second.terminate(background_stop_grace);
        }
        _background.erase(bg);
    }

    if (failure) {
        log_output(spec.name, *failure);
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::teardown_failed>(
                                       "Failed to tear down service '{}': `{}` {}",
                                       spec.name,
                                       failed_cmd,
                                       failure->describe()),
                                   e_service_name{spec.name});
    }
}
