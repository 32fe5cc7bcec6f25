#pragma once

#include <chrono>

namespace drydock {

/// Measures time since construction on the steady clock
class stopwatch {
public:
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using duration   = time_point::duration;

private:
    time_point _start_time = clock::now();

public:
    duration elapsed() const noexcept { return clock::now() - _start_time; }

    std::chrono::milliseconds elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed());
    }
};

}  // namespace drydock
