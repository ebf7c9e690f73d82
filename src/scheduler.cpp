#include "boatcount/scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

namespace boatcount {

namespace {

// Upper bound on a single backoff wait when no cap is configured (one day)
constexpr double kMaxBackoffMs = 24.0 * 3600.0 * 1000.0;

} // namespace

const char* toString(SchedulerState state) {
    return state == SchedulerState::Active ? "active" : "sleeping";
}

const char* toString(TickResult result) {
    switch (result) {
        case TickResult::Ready: return "ready";
        case TickResult::Sleeping: return "sleeping";
        case TickResult::AcquireFailed: return "acquire-failed";
        case TickResult::Cancelled: return "cancelled";
    }
    return "unknown";
}

AcquisitionScheduler::AcquisitionScheduler(const SchedulerConfig& config,
                                           CaptureDevice& device,
                                           DaylightPredicate is_daytime,
                                           Clock& clock,
                                           const CancellationToken& cancel)
    : config_(config)
    , device_(device)
    , is_daytime_(std::move(is_daytime))
    , clock_(clock)
    , cancel_(cancel)
    , state_(SchedulerState::Active)
    , started_(false) {
    if (!is_daytime_) {
        throw std::invalid_argument("scheduler needs a daylight predicate");
    }
    if (config_.max_open_attempts < 1) {
        throw std::invalid_argument("max_open_attempts must be at least 1");
    }
}

SchedulerState AcquisitionScheduler::start() {
    const WallTime now = clock_.wallNow();
    state_ = is_daytime_(now) ? SchedulerState::Active : SchedulerState::Sleeping;
    started_ = true;
    spdlog::info("Scheduler starting {} at {:%Y-%m-%d %H:%M:%S}", toString(state_),
        fmt::localtime(std::chrono::system_clock::to_time_t(now)));
    return state_;
}

void AcquisitionScheduler::enterSleeping(WallTime now) {
    state_ = SchedulerState::Sleeping;
    spdlog::info("Nighttime {:%H:%M} - sleeping {} s",
        fmt::localtime(std::chrono::system_clock::to_time_t(now)), config_.sleep_duration.count());
    stop();
}

TickResult AcquisitionScheduler::tick() {
    if (cancel_.stopRequested()) {
        stop();
        return TickResult::Cancelled;
    }
    if (!started_) {
        start();
    }

    if (state_ == SchedulerState::Active) {
        const WallTime now = clock_.wallNow();
        if (!is_daytime_(now)) {
            enterSleeping(now);
            return TickResult::Sleeping;
        }
        if (device_.isOpen()) {
            return TickResult::Ready;
        }
    } else {
        if (!clock_.waitFor(config_.sleep_duration, cancel_)) {
            stop();
            return TickResult::Cancelled;
        }
        const WallTime now = clock_.wallNow();
        if (!is_daytime_(now)) {
            spdlog::debug("Still night at {:%H:%M}", fmt::localtime(std::chrono::system_clock::to_time_t(now)));
            return TickResult::Sleeping;
        }
        state_ = SchedulerState::Active;
        spdlog::info("Daylight at {:%H:%M} - resuming capture",
            fmt::localtime(std::chrono::system_clock::to_time_t(now)));
    }

    last_acquire_ = acquire();
    if (last_acquire_.opened) {
        return TickResult::Ready;
    }
    if (last_acquire_.cancelled) {
        stop();
        return TickResult::Cancelled;
    }
    return TickResult::AcquireFailed;
}

std::chrono::milliseconds AcquisitionScheduler::backoffDelay(int attempt) const {
    // Clamped before conversion to an integer duration
    double limit_ms = kMaxBackoffMs;
    if (config_.max_backoff.count() > 0) {
        limit_ms = std::min(limit_ms, static_cast<double>(config_.max_backoff.count()));
    }
    const double delay_ms = std::min(std::pow(config_.backoff_base, attempt) * 1000.0, limit_ms);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay_ms)));
}

AcquireResult AcquisitionScheduler::acquire() {
    AcquireResult result;
    for (int attempt = 1; attempt <= config_.max_open_attempts; ++attempt) {
        result.attempts = attempt;
        if (device_.open()) {
            result.opened = true;
            spdlog::info("Capture {} opened", device_.describe());
            return result;
        }

        const auto delay = backoffDelay(attempt);
        spdlog::error("Camera open error [{}/{}] on {} - retrying in {} ms",
            attempt, config_.max_open_attempts, device_.describe(), delay.count());
        result.total_backoff += delay;
        if (!clock_.waitFor(delay, cancel_)) {
            result.cancelled = true;
            return result;
        }
    }

    spdlog::error("Capture {} could not be opened after {} attempts ({} ms of backoff)",
        device_.describe(), result.attempts, result.total_backoff.count());
    return result;
}

void AcquisitionScheduler::stop() {
    if (device_.isOpen()) {
        device_.release();
        spdlog::debug("Capture {} released", device_.describe());
    }
}

} // namespace boatcount
