#pragma once

#include <atomic>
#include <chrono>

namespace boatcount {

using WallTime = std::chrono::system_clock::time_point;
using MonoTime = std::chrono::steady_clock::time_point;

/**
 * @brief Stop flag shared between a signal handler and the frame loop
 *
 * requestStop() only stores to a lock-free atomic, so it is safe to call from a
 * signal handler.
 */
class CancellationToken {
public:
    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

private:
    std::atomic<bool> stop_{false};
};

class Clock {
public:
    virtual ~Clock() = default;

    // Wall-clock time, for daylight checks and event timestamps
    virtual WallTime wallNow() const = 0;

    // Monotonic time, for cooldown arithmetic
    virtual MonoTime monoNow() const = 0;

    /**
     * @brief Block for the given duration unless cancelled
     *
     * @return true if the full duration elapsed, false if cancellation was requested
     */
    virtual bool waitFor(std::chrono::milliseconds duration, const CancellationToken& cancel) = 0;
};

class SystemClock : public Clock {
public:
    /**
     * @param poll_interval Granularity at which a wait re-checks the cancellation token
     */
    explicit SystemClock(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    WallTime wallNow() const override;
    MonoTime monoNow() const override;
    bool waitFor(std::chrono::milliseconds duration, const CancellationToken& cancel) override;

private:
    std::chrono::milliseconds poll_interval_;
};

} // namespace boatcount
