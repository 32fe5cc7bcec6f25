#ifndef _WIN32
#include "./proc.hpp"

#include "./shlex.hpp"
#include "./signal.hpp"
#include "./time.hpp"

#include <drydock/util/log.hpp>

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

extern char** environ;

using namespace drydock;
using namespace std::chrono_literals;

namespace {

constexpr auto timeout_kill_grace = 5s;

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// Closes a file descriptor when it goes out of scope
struct fd_guard {
    int fd = -1;

    fd_guard() = default;
    explicit fd_guard(int f)
        : fd(f) {}
    fd_guard(const fd_guard&) = delete;
    ~fd_guard() { reset(); }

    void reset() noexcept {
        if (fd != -1) {
            ::close(fd);
        }
        fd = -1;
    }
};

std::vector<std::string> make_environment(const env_map& overrides) {
    env_map merged;
    for (char** ent = environ; ent && *ent; ++ent) {
        std::string_view kv = *ent;
        auto             eq = kv.find('=');
        if (eq == kv.npos) {
            continue;
        }
        merged.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    merged = merge_env(std::move(merged), overrides);

    std::vector<std::string> ret;
    ret.reserve(merged.size());
    for (auto& [key, value] : merged) {
        ret.push_back(key + "=" + value);
    }
    return ret;
}

void child_write(std::string_view s) noexcept {
    while (!s.empty()) {
        auto n = ::write(STDERR_FILENO, s.data(), s.size());
        if (n <= 0) {
            return;
        }
        s.remove_prefix(static_cast<std::size_t>(n));
    }
}

struct child_stdio {
    int out_fd = -1;
    int in_fd  = -1;
};

/// Spawn the child as the leader of a new process group, so that it and everything it forks can be
/// signalled together
::pid_t spawn_child(const proc_options& opts, child_stdio stdio) {
    neo_assert(expects,
               !opts.command.empty(),
               "Attempted to spawn a subprocess with an empty command");
    // Everything the child needs must be allocated BEFORE fork(). Only async-signal-safe calls are
    // permitted in the child.
    std::vector<const char*> argv;
    argv.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    auto                     env_strings = make_environment(opts.env);
    std::vector<const char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    std::string workdir = opts.cwd ? opts.cwd->string() : std::string();
    auto        not_found_err
        = neo::ufmt("[drydock child executor] The requested executable [{}] could not be found.\n",
                    opts.command.front());
    auto chdir_err
        = neo::ufmt("[drydock child executor] Failed to enter the working directory [{}]\n",
                    workdir);

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() a subprocess");
    if (child_pid != 0) {
        return child_pid;
    }

    // We are the child
    ::setpgid(0, 0);
    // Ignored dispositions survive exec()
    ::signal(SIGPIPE, SIG_DFL);
    if (stdio.out_fd != -1) {
        ::dup2(stdio.out_fd, STDOUT_FILENO);
        ::dup2(stdio.out_fd, STDERR_FILENO);
    }
    if (stdio.in_fd != -1) {
        ::dup2(stdio.in_fd, STDIN_FILENO);
    }
    if (!workdir.empty() && ::chdir(workdir.data()) == -1) {
        child_write(chdir_err);
        std::_Exit(127);
    }

    ::execvpe(argv[0], const_cast<char* const*>(argv.data()), const_cast<char* const*>(envp.data()));

    if (errno == ENOENT) {
        child_write(not_found_err);
        std::_Exit(127);
    }
    child_write("[drydock child executor] execvpe() returned! This is a fatal error: ");
    child_write(std::strerror(errno));
    child_write("\n");
    std::_Exit(127);
}

void decode_status(int status, proc_result& res) noexcept {
    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }
}

/// Returns true if `pid` has exited, filling in the result
bool reap_nohang(::pid_t pid, proc_result& res) {
    int  status = 0;
    auto rc     = ::waitpid(pid, &status, WNOHANG);
    if (rc == -1 && errno == EINTR) {
        return false;
    }
    check_rc(rc != -1, "Failed in waitpid()");
    if (rc == 0) {
        return false;
    }
    decode_status(status, res);
    return true;
}

void sleep_briefly() noexcept { ::poll(nullptr, 0, 20); }

::pid_t spawn_group(const proc_options& opts, child_stdio stdio) {
    auto pid = spawn_child(opts, stdio);
    // Also set the group from the parent, so that a kill() issued right away cannot race the child
    ::setpgid(pid, pid);
    return pid;
}

}  // namespace

proc_result drydock::run_proc(const proc_options& opts) {
    drydock_log(debug, "Spawning subprocess: {}", quote_command(opts.command));

    fd_guard read_end;
    fd_guard write_end;
    fd_guard file_out;

    child_stdio stdio;
    if (opts.output_file) {
        file_out.fd = ::open(opts.output_file->string().c_str(),
                             O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                             0644);
        check_rc(file_out.fd != -1,
                 neo::ufmt("Failed to open subprocess output file [{}]",
                           opts.output_file->string()));
        stdio.out_fd = file_out.fd;
    } else if (opts.capture_output) {
        int  fds[2] = {};
        auto rc     = ::pipe2(fds, O_CLOEXEC);
        check_rc(rc == 0, "Create stdio pipe for subprocess");
        read_end.fd  = fds[0];
        write_end.fd = fds[1];
        stdio.out_fd = write_end.fd;
    }

    const auto child = spawn_group(opts, stdio);
    write_end.reset();
    file_out.reset();

    proc_result res;
    stopwatch   sw;
    bool        eof    = read_end.fd == -1;
    bool        reaped = false;

    std::optional<stopwatch> kill_clock;
    bool                     sent_kill = false;

    auto drain = [&](int wait_ms) {
        pollfd pfd{};
        pfd.fd     = read_end.fd;
        pfd.events = POLLIN;
        auto rc    = ::poll(&pfd, 1, wait_ms);
        if (rc == -1) {
            check_rc(errno == EINTR, "Failed in poll()");
            return false;
        }
        if (rc == 0) {
            return false;
        }
        char buffer[4096];
        auto nread = ::read(read_end.fd, buffer, sizeof buffer);
        if (nread == 0) {
            eof = true;
            return false;
        }
        if (nread < 0) {
            check_rc(errno == EINTR || errno == EAGAIN, "Failed in read()");
            return false;
        }
        res.output.append(buffer, static_cast<std::size_t>(nread));
        return true;
    };

    while (true) {
        if (!eof) {
            drain(50);
        } else {
            sleep_briefly();
        }

        if (!reaped) {
            reaped = reap_nohang(child, res);
        }
        if (reaped) {
            if (kill_clock) {
                // The shell is gone, but the commands it forked share its group
                ::kill(-child, SIGKILL);
            }
            // Collect whatever is left. Anything the child left running in the background may keep
            // the pipe open, so do not wait for EOF.
            while (!eof && drain(0)) {
            }
            break;
        }

        if (!kill_clock) {
            if (opts.timeout && sw.elapsed() >= *opts.timeout) {
                drydock_log(debug,
                            "Subprocess [{}] timed out after {}ms",
                            quote_command(opts.command),
                            opts.timeout->count());
                ::kill(-child, SIGTERM);
                res.timed_out = true;
                kill_clock.emplace();
            } else if (opts.cancellable && is_cancelled()) {
                ::kill(-child, SIGINT);
                kill_clock.emplace();
            }
        } else if (!sent_kill && kill_clock->elapsed() >= timeout_kill_grace) {
            ::kill(-child, SIGKILL);
            sent_kill = true;
        }
    }

    if (opts.cancellable) {
        cancellation_point();
    }
    return res;
}

child_process child_process::spawn(const proc_options& opts) {
    drydock_log(debug, "Spawning background process: {}", quote_command(opts.command));

    fd_guard devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    check_rc(devnull.fd != -1, "Failed to open /dev/null");

    fd_guard    file_out;
    child_stdio stdio{.out_fd = -1, .in_fd = devnull.fd};
    if (opts.output_file) {
        file_out.fd = ::open(opts.output_file->string().c_str(),
                             O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                             0644);
        check_rc(file_out.fd != -1,
                 neo::ufmt("Failed to open process output file [{}]", opts.output_file->string()));
        stdio.out_fd = file_out.fd;
    }

    auto pid = spawn_group(opts, stdio);
    return child_process(pid, quote_command(opts.command));
}

child_process::child_process(child_process&& other) noexcept
    : _pid(std::exchange(other._pid, -1))
    , _description(std::move(other._description))
    , _exited(std::move(other._exited)) {}

child_process& child_process::operator=(child_process&& other) noexcept {
    if (this != &other) {
        if (_pid != -1 && !_exited) {
            ::kill(-_pid, SIGKILL);
            ::waitpid(_pid, nullptr, 0);
        }
        _pid         = std::exchange(other._pid, -1);
        _description = std::move(other._description);
        _exited      = std::move(other._exited);
    }
    return *this;
}

child_process::~child_process() {
    if (_pid != -1 && !_exited) {
        ::kill(-_pid, SIGKILL);
        ::waitpid(_pid, nullptr, 0);
    }
}

std::optional<proc_result> child_process::try_wait() {
    if (_exited || _pid == -1) {
        return _exited;
    }
    proc_result res;
    if (reap_nohang(_pid, res)) {
        _exited = res;
    }
    return _exited;
}

proc_result child_process::terminate(std::chrono::milliseconds grace) {
    neo_assert(expects, _pid != -1, "terminate() called on an empty child_process");
    if (try_wait()) {
        return *_exited;
    }
    drydock_log(debug, "Sending SIGTERM to process group {} [{}]", _pid, _description);
    ::kill(-_pid, SIGTERM);
    stopwatch sw;
    while (!try_wait()) {
        if (sw.elapsed() >= grace) {
            drydock_log(debug,
                        "Process group {} did not exit within {}ms, sending SIGKILL",
                        _pid,
                        grace.count());
            ::kill(-_pid, SIGKILL);
            int  status = 0;
            auto rc     = ::waitpid(_pid, &status, 0);
            check_rc(rc != -1, "Failed in waitpid()");
            proc_result res;
            decode_status(status, res);
            _exited = res;
            break;
        }
        sleep_briefly();
    }
    return *_exited;
}

#endif  // _WIN32
