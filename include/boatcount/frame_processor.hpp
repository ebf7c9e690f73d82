#pragma once

#include <cstddef>
#include <vector>
#include "boatcount/config.hpp"
#include "boatcount/crossing_counter.hpp"
#include "boatcount/crossing_event.hpp"
#include "boatcount/detection.hpp"
#include "boatcount/event_sink.hpp"
#include "boatcount/tracker.hpp"

namespace boatcount {

struct FrameResult {
    std::vector<TrackedObject> tracks;      // Confirmed tracks matched this frame
    std::vector<CrossingEvent> events;      // Crossings counted this frame
    std::size_t rejected = 0;               // Malformed detections dropped
};

/**
 * @brief Runs one frame through filtering, tracking, counting and dispatch
 *
 * Owns the Tracker and the CrossingCounter; frames must be passed in arrival order.
 */
class FrameProcessor {
public:
    /**
     * @param config Detection, tracker and counter settings are used
     * @param frame_width Frame width in pixels, for resolving a relative line
     * @param frame_height Frame height in pixels
     * @param dispatcher Receives every counted crossing; must outlive the processor
     */
    FrameProcessor(const AppConfig& config, int frame_width, int frame_height, EventDispatcher& dispatcher);

    FrameResult process(const std::vector<RawDetection>& raw, const FrameStamp& stamp);

    /**
     * @brief Forget all tracks and their position histories
     *
     * Call when frames stop arriving (night, capture released) so stale tracks
     * cannot be matched to detections after the gap. Totals and the cooldown
     * ledger are kept.
     *
     * @return std::size_t Number of tracks dropped
     */
    std::size_t resetTracking();

    const Tracker& getTracker() const { return tracker_; }
    const CrossingCounter& getCounter() const { return counter_; }

private:
    DetectionConfig detection_;
    Tracker tracker_;
    CrossingCounter counter_;
    EventDispatcher& dispatcher_;
};

} // namespace boatcount
