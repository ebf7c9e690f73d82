#include "boatcount/frame_processor.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace boatcount {

namespace {

float resolveLine(const CountingLine& line, int frame_width, int frame_height) {
    if (frame_width <= 0 || frame_height <= 0) {
        throw std::invalid_argument("frame size must be positive");
    }
    return line.resolve(frame_width, frame_height);
}

} // namespace

FrameProcessor::FrameProcessor(const AppConfig& config, int frame_width, int frame_height,
                               EventDispatcher& dispatcher)
    : detection_(config.detection)
    , tracker_(config.tracker)
    , counter_(config.counter, resolveLine(config.counter.line, frame_width, frame_height))
    , dispatcher_(dispatcher) {
    spdlog::info("Counting line {} at {:.1f}px on a {}x{} frame",
        toString(config.counter.line.axis), counter_.getLineCoordinate(), frame_width, frame_height);
}

FrameResult FrameProcessor::process(const std::vector<RawDetection>& raw, const FrameStamp& stamp) {
    FrameResult result;

    const auto detections = filterDetections(raw, detection_.class_id, detection_.min_confidence, &result.rejected);
    result.tracks = tracker_.update(detections);
    counter_.forget(tracker_.getDeletedIds());
    result.events = counter_.observe(result.tracks, stamp);

    for (const auto& event : result.events) {
        dispatcher_.dispatch(event);
    }
    return result;
}

std::size_t FrameProcessor::resetTracking() {
    tracker_.clear();
    const auto& dropped = tracker_.getDeletedIds();
    counter_.forget(dropped);
    return dropped.size();
}

} // namespace boatcount
