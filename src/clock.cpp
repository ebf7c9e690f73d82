#include "boatcount/clock.hpp"
#include <algorithm>
#include <thread>

namespace boatcount {

SystemClock::SystemClock(std::chrono::milliseconds poll_interval)
    : poll_interval_(std::max(poll_interval, std::chrono::milliseconds(1))) {
}

WallTime SystemClock::wallNow() const {
    return std::chrono::system_clock::now();
}

MonoTime SystemClock::monoNow() const {
    return std::chrono::steady_clock::now();
}

bool SystemClock::waitFor(std::chrono::milliseconds duration, const CancellationToken& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancel.stopRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, poll_interval_));
    }
    return false;
}

} // namespace boatcount
