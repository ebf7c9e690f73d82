#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "boatcount/clock.hpp"
#include "boatcount/config.hpp"

namespace boatcount {

/**
 * @brief Capture resource as seen by the scheduler: it opens and releases it, never reads
 */
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    // Returns false on failure; must not throw for ordinary device errors
    virtual bool open() = 0;
    virtual void release() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string describe() const = 0;
};

enum class SchedulerState {
    Active,
    Sleeping
};

enum class TickResult {
    Ready,          // capture is open, read a frame
    Sleeping,       // night time, nothing to do
    AcquireFailed,  // all open attempts failed, retried on the next tick
    Cancelled
};

const char* toString(SchedulerState state);
const char* toString(TickResult result);

struct AcquireResult {
    bool opened = false;
    bool cancelled = false;
    int attempts = 0;
    std::chrono::milliseconds total_backoff{0};
};

/**
 * @brief Gates frame acquisition on daylight and owns the capture lifecycle
 *
 * ACTIVE -> SLEEPING when the daylight predicate turns false at a tick; the capture
 * is released on entry. SLEEPING -> ACTIVE after the suspend duration if the
 * predicate is true again, then the capture is re-acquired. Opening is retried with
 * exponential backoff; exhaustion is reported through TickResult and the next tick
 * tries again. All waits observe the cancellation token.
 */
class AcquisitionScheduler {
public:
    using DaylightPredicate = std::function<bool(WallTime)>;

    AcquisitionScheduler(const SchedulerConfig& config,
                         CaptureDevice& device,
                         DaylightPredicate is_daytime,
                         Clock& clock,
                         const CancellationToken& cancel);

    /**
     * @brief Compute the initial state from the daylight predicate
     *
     * Called by the first tick() if not called explicitly.
     */
    SchedulerState start();

    /**
     * @brief One scheduling step, run once per frame iteration
     */
    TickResult tick();

    /**
     * @brief Open the capture with up to max_open_attempts tries
     *
     * After failed attempt k the scheduler waits min(backoff_base^k seconds, max_backoff).
     */
    AcquireResult acquire();

    /**
     * @brief Release the capture resource if it is open
     */
    void stop();

    SchedulerState getState() const { return state_; }
    const AcquireResult& getLastAcquire() const { return last_acquire_; }

private:
    std::chrono::milliseconds backoffDelay(int attempt) const;
    void enterSleeping(WallTime now);

    SchedulerConfig config_;
    CaptureDevice& device_;
    DaylightPredicate is_daytime_;
    Clock& clock_;
    const CancellationToken& cancel_;

    SchedulerState state_;
    bool started_;
    AcquireResult last_acquire_;
};

} // namespace boatcount
