#pragma once

#include <chrono>
#include <stdexcept>

namespace drydock {

class user_cancelled : public std::exception {
public:
    const char* what() const noexcept override { return "Operation cancelled by the user"; }
};

void install_signal_handlers() noexcept;

void notify_cancel() noexcept;
void reset_cancelled() noexcept;
bool is_cancelled() noexcept;
void cancellation_point();

/**
 * @brief Sleep for the given duration, waking early to throw user_cancelled if a cancellation
 * signal arrives.
 */
void sleep_interruptible(std::chrono::milliseconds);

}  // namespace drydock
