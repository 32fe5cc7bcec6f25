#pragma once

#include <drydock/util/env.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drydock {

struct proc_result {
    int         signal    = 0;
    int         retc      = 0;
    bool        timed_out = false;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0 && !timed_out; }

    /// "exited with status 3", "was killed by signal 9", or "timed out"
    std::string describe() const;
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;

    /// Variables set (or replaced) on top of this process's environment
    env_map env = {};

    /**
     * Timeout for the subprocess. If unset, will wait forever. On expiry the child's process group
     * receives SIGTERM, then SIGKILL if it does not exit within a short grace period.
     */
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;

    /// If false, the child writes directly to our stdout/stderr
    bool capture_output = true;

    /// If set, stdout and stderr are appended to this file (overrides `capture_output`)
    std::optional<std::filesystem::path> output_file = std::nullopt;

    /**
     * If true, a pending SIGINT/SIGTERM interrupts the child and raises user_cancelled. Teardown
     * commands run with this disabled so that they complete after the user has hit Ctrl+C.
     */
    bool cancellable = true;
};

/**
 * @brief Build the argv for running `cmd` through the POSIX shell.
 */
std::vector<std::string> shell_command(std::string_view cmd);

/**
 * @brief Run a subprocess to completion.
 *
 * The child leads its own process group. A timeout or cancellation signals the whole group, so
 * commands forked by a shell do not outlive it.
 *
 * Throws std::system_error if the process could not be spawned at all. A command that cannot be
 * found is reported as exit status 127, the same as the shell would.
 */
proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

/**
 * @brief A handle to a process that runs in the background, in its own process group. If the
 * handle is destroyed while the process is alive, the process group is killed.
 */
class child_process {
    int                        _pid = -1;
    std::string                _description;
    std::optional<proc_result> _exited;

    child_process(int pid, std::string desc)
        : _pid(pid)
        , _description(std::move(desc)) {}

public:
    /// Spawn a background process. stdin is /dev/null. `timeout` and `capture_output` are ignored.
    [[nodiscard]] static child_process spawn(const proc_options& opts);

    child_process(child_process&& other) noexcept;
    child_process& operator=(child_process&& other) noexcept;
    ~child_process();

    int                pid() const noexcept { return _pid; }
    const std::string& description() const noexcept { return _description; }

    /// Check, without blocking, whether the process has exited
    std::optional<proc_result> try_wait();

    /// SIGTERM the process group, then SIGKILL it if it is still alive after `grace`
    proc_result terminate(std::chrono::milliseconds grace);
};

}  // namespace drydock
