#include "./signal.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace {

volatile std::sig_atomic_t got_signal = 0;

void handle_signal(int sig) { got_signal = sig; }

}  // namespace

using namespace drydock;

void drydock::notify_cancel() noexcept { got_signal = SIGINT; }
void drydock::reset_cancelled() noexcept { got_signal = 0; }

void drydock::install_signal_handlers() noexcept {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

#ifdef SIGQUIT
    std::signal(SIGQUIT, handle_signal);
#endif

#ifdef SIGPIPE
    // A service or test command that closes its end of a pipe early must not kill us before
    // teardown has run.
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

bool drydock::is_cancelled() noexcept { return got_signal != 0; }
void drydock::cancellation_point() {
    if (is_cancelled()) {
        throw user_cancelled();
    }
}

void drydock::sleep_interruptible(std::chrono::milliseconds dur) {
    using namespace std::chrono_literals;
    auto end = std::chrono::steady_clock::now() + dur;
    while (true) {
        cancellation_point();
        auto now = std::chrono::steady_clock::now();
        if (now >= end) {
            break;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(end - now, 50ms));
    }
}
