#include "boatcount/crossing_counter.hpp"
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace boatcount {

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::LeftToRight: return "left-to-right";
        case Direction::RightToLeft: return "right-to-left";
        case Direction::TopToBottom: return "top-to-bottom";
        case Direction::BottomToTop: return "bottom-to-top";
    }
    return "unknown";
}

CrossingCounter::CrossingCounter(const CounterConfig& config, float line_coordinate)
    : config_(config)
    , line_(line_coordinate)
    , sequence_(0)
    , observations_(0) {
    if (config_.history_size < 2) {
        throw std::invalid_argument("crossing history must hold at least 2 points");
    }
    if (!std::isfinite(line_)) {
        throw std::invalid_argument("line coordinate must be finite");
    }
}

float CrossingCounter::axisValue(const Eigen::Vector2f& point) const {
    return config_.line.axis == LineAxis::Vertical ? point.x() : point.y();
}

bool CrossingCounter::onFarSide(const Eigen::Vector2f& point) const {
    return axisValue(point) >= line_;
}

Direction CrossingCounter::directionOf(float displacement) const {
    if (config_.line.axis == LineAxis::Vertical) {
        return displacement > 0.0f ? Direction::LeftToRight : Direction::RightToLeft;
    }
    return displacement > 0.0f ? Direction::TopToBottom : Direction::BottomToTop;
}

std::vector<CrossingEvent> CrossingCounter::observe(const std::vector<TrackedObject>& objects,
                                                    const FrameStamp& stamp) {
    std::vector<CrossingEvent> events;

    for (const auto& object : objects) {
        TrackHistory& history = histories_[object.track_id];
        history.points.push_back({object.center, ++observations_});
        while (history.points.size() > config_.history_size) {
            history.points.pop_front();
        }

        const auto& points = history.points;
        if (points.size() < 2) continue;

        // Any unspent consecutive pair on opposite sides of the line
        bool crossed = false;
        for (size_t i = 1; i < points.size(); ++i) {
            if (points[i].seq <= history.consumed_seq) continue;
            if (onFarSide(points[i - 1].center) != onFarSide(points[i].center)) {
                crossed = true;
                break;
            }
        }
        if (!crossed) continue;

        const float displacement = axisValue(points.back().center) - axisValue(points.front().center);
        if (std::abs(displacement) <= config_.min_distance) {
            spdlog::debug("Track {} straddles the line but moved only {:.1f}px", object.track_id, displacement);
            continue;
        }

        const Direction direction = directionOf(displacement);
        auto last = last_counted_.find(object.track_id);
        if (last != last_counted_.end() && stamp.mono - last->second < config_.cooldown) {
            history.consumed_seq = points.back().seq;
            spdlog::debug("Track {} crossing {} suppressed by cooldown", object.track_id, toString(direction));
            continue;
        }

        history.consumed_seq = points.back().seq;
        last_counted_[object.track_id] = stamp.mono;
        per_direction_[direction] += 1;

        events.push_back({++sequence_, object.track_id, stamp.wall, direction, stamp.index, object.tlbr});
    }
    return events;
}

void CrossingCounter::forget(const std::vector<int>& track_ids) {
    for (int id : track_ids) {
        histories_.erase(id);
    }
}

std::uint64_t CrossingCounter::getCount(Direction direction) const {
    auto it = per_direction_.find(direction);
    return it == per_direction_.end() ? 0 : it->second;
}

std::size_t CrossingCounter::historySize(int track_id) const {
    auto it = histories_.find(track_id);
    return it == histories_.end() ? 0 : it->second.points.size();
}

} // namespace boatcount
