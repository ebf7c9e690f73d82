#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <deque>
#include <map>
#include <vector>
#include "boatcount/config.hpp"
#include "boatcount/crossing_event.hpp"
#include "boatcount/tracker.hpp"

namespace boatcount {

/**
 * @brief Turns confirmed-track positions into de-duplicated line crossing events
 *
 * Keeps a bounded center-point history per track. A track is counted when some
 * consecutive pair of its history points straddles the line, its net displacement
 * across the window exceeds the minimum distance, and it has not been counted
 * within the cooldown interval. A straddling pair is consumed once counted or
 * suppressed by the cooldown.
 */
class CrossingCounter {
public:
    /**
     * @param config Counting parameters
     * @param line_coordinate Resolved line position in pixels along the line's axis
     */
    CrossingCounter(const CounterConfig& config, float line_coordinate);

    /**
     * @brief Record one frame of confirmed tracks and return the crossings it completes
     *
     * Tracks must be observed in frame order.
     */
    std::vector<CrossingEvent> observe(const std::vector<TrackedObject>& objects, const FrameStamp& stamp);

    /**
     * @brief Drop the position history of deleted tracks; the cooldown ledger is kept
     */
    void forget(const std::vector<int>& track_ids);

    // Getters
    std::uint64_t getTotal() const { return sequence_; }
    std::uint64_t getCount(Direction direction) const;
    float getLineCoordinate() const { return line_; }
    LineAxis getAxis() const { return config_.line.axis; }
    std::size_t historySize(int track_id) const;
    std::size_t trackedHistories() const { return histories_.size(); }

private:
    struct HistoryPoint {
        Eigen::Vector2f center;
        std::uint64_t seq;      // Observation number, unique per counter
    };

    struct TrackHistory {
        std::deque<HistoryPoint> points;
        std::uint64_t consumed_seq = 0;   // Crossing pairs ending at or before this are spent
    };

    float axisValue(const Eigen::Vector2f& point) const;
    bool onFarSide(const Eigen::Vector2f& point) const;
    Direction directionOf(float displacement) const;

    CounterConfig config_;
    float line_;
    std::uint64_t sequence_;
    std::uint64_t observations_;
    std::map<int, TrackHistory> histories_;
    std::map<int, MonoTime> last_counted_;         // Cooldown ledger
    std::map<Direction, std::uint64_t> per_direction_;
};

} // namespace boatcount
