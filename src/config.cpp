#include "boatcount/config.hpp"
#include <cmath>
#include <spdlog/common.h>

namespace boatcount {

namespace {

void require(bool condition, const char* key, const char* message) {
    if (!condition) {
        throw ConfigError(std::string(key) + ": " + message);
    }
}

// All digits means a camera index; it has to fit an int
bool cameraIndexInRange(const std::string& source) {
    if (source.find_first_not_of("0123456789") != std::string::npos) {
        return true;
    }
    const auto first = source.find_first_not_of('0');
    return first == std::string::npos || source.size() - first <= 9;
}

bool isLevelName(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

} // namespace

float CountingLine::resolve(int frame_width, int frame_height) const {
    if (!relative) {
        return position;
    }
    const int extent = axis == LineAxis::Vertical ? frame_width : frame_height;
    return position * static_cast<float>(extent);
}

void AppConfig::validate() const {
    require(detection.min_confidence >= 0.0f && detection.min_confidence <= 1.0f,
            "detection.min_confidence", "must be within [0, 1]");

    require(tracker.max_age >= 1, "tracker.max_age", "must be at least 1");
    require(tracker.n_init >= 1, "tracker.n_init", "must be at least 1");
    require(tracker.iou_threshold > 0.0f && tracker.iou_threshold <= 1.0f,
            "tracker.iou_threshold", "must be within (0, 1]");

    require(std::isfinite(counter.line.position), "counter.line_position", "must be finite");
    if (counter.line.relative) {
        require(counter.line.position >= 0.0f && counter.line.position <= 1.0f,
                "counter.line_position", "relative position must be within [0, 1]");
    }
    require(counter.history_size >= 2, "counter.history_size", "must be at least 2");
    require(counter.min_distance >= 0.0f, "counter.min_distance", "must not be negative");
    require(counter.cooldown.count() >= 0, "counter.cooldown_sec", "must not be negative");

    require(scheduler.sleep_duration.count() > 0, "scheduler.sleep_sec", "must be positive");
    require(scheduler.max_open_attempts >= 1, "scheduler.max_open_attempts", "must be at least 1");
    require(scheduler.backoff_base >= 1.0, "scheduler.backoff_base", "must be at least 1");
    require(scheduler.max_backoff.count() >= 0, "scheduler.max_backoff_sec", "must not be negative");

    require(daylight.latitude >= -90.0 && daylight.latitude <= 90.0,
            "daylight.latitude", "must be within [-90, 90]");
    require(daylight.longitude >= -180.0 && daylight.longitude <= 180.0,
            "daylight.longitude", "must be within [-180, 180]");

    require(!capture.source.empty(), "capture.source", "must not be empty");
    require(cameraIndexInRange(capture.source), "capture.source", "camera index out of range");
    require(capture.width > 0 && capture.height > 0, "capture.width", "frame size must be positive");
    require(capture.max_read_failures >= 1, "capture.max_read_failures", "must be at least 1");

    require(isLevelName(logging.level), "logging.level", "unknown level name");
    require(logging.max_files >= 1, "logging.max_files", "must be at least 1");
    require(logging.max_file_size > 0, "logging.max_file_size", "must be positive");
}

const char* toString(LineAxis axis) {
    return axis == LineAxis::Vertical ? "vertical" : "horizontal";
}

const char* toString(DaylightWindow window) {
    return window == DaylightWindow::Civil ? "civil" : "official";
}

} // namespace boatcount
