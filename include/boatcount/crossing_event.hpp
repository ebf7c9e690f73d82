#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include "boatcount/clock.hpp"

namespace boatcount {

enum class Direction {
    LeftToRight,
    RightToLeft,
    TopToBottom,
    BottomToTop
};

const char* toString(Direction direction);

/**
 * @brief Identifies the frame an observation belongs to
 */
struct FrameStamp {
    std::uint64_t index = 0;
    WallTime wall;
    MonoTime mono;
};

/**
 * @brief One counted crossing; created once and never modified
 */
struct CrossingEvent {
    std::uint64_t sequence;     // 1-based, monotonic across the process
    int track_id;
    WallTime timestamp;
    Direction direction;
    std::uint64_t frame_index;  // Frame in which the crossing was counted
    Eigen::Vector4f tlbr;       // Track box in that frame, for cropping
};

} // namespace boatcount
