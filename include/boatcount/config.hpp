#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace boatcount {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DetectionConfig {
    // COCO class 8 is "boat"; negative keeps every class
    int class_id = 8;
    float min_confidence = 0.35f;
};

struct TrackerConfig {
    // Maximum number of consecutive misses before a track is deleted
    int max_age = 30;
    // Number of matched detections before a track is confirmed
    int n_init = 3;
    // Minimum IoU for a track/detection pair to be accepted
    float iou_threshold = 0.3f;
};

enum class LineAxis {
    Vertical,     // x = position
    Horizontal    // y = position
};

struct CountingLine {
    LineAxis axis = LineAxis::Vertical;
    // Fraction of the frame width (height for horizontal lines) when relative,
    // pixels otherwise
    float position = 0.5f;
    bool relative = true;

    /**
     * @brief Line coordinate in pixels for a frame of the given size
     */
    float resolve(int frame_width, int frame_height) const;
};

struct CounterConfig {
    CountingLine line;
    std::size_t history_size = 15;
    // Net displacement across the history window required to count, in pixels
    float min_distance = 15.0f;
    std::chrono::milliseconds cooldown{5000};
};

struct SchedulerConfig {
    std::chrono::seconds sleep_duration{300};
    int max_open_attempts = 5;
    double backoff_base = 2.0;
    // Upper bound on a single backoff delay; zero leaves only the one-day ceiling
    std::chrono::milliseconds max_backoff{0};
};

enum class DaylightWindow {
    Civil,       // dawn to dusk
    Official     // sunrise to sunset
};

struct DaylightConfig {
    bool enabled = true;
    double latitude = 38.833;
    double longitude = -104.821;
    DaylightWindow window = DaylightWindow::Civil;
};

struct CaptureConfig {
    // Camera index or video file path
    std::string source = "0";
    int width = 640;
    int height = 360;
    std::string mask_path = "mask.png";
    int max_read_failures = 30;
    std::chrono::milliseconds read_retry_delay{100};
};

struct SinkConfig {
    bool log_events = true;
    bool snapshot_enabled = true;
    std::string snapshot_dir = "snapshots";
    // Save the track's crop instead of the full frame
    bool snapshot_crop = true;
    bool csv_enabled = true;
    std::string csv_path = "boat_counts.csv";
};

struct LoggingConfig {
    std::string directory = "logs";
    std::string file_name = "boatcount.log";
    std::string level = "debug";
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    bool console = true;
};

struct ReplayConfig {
    // CSV of frame,class_id,confidence,x1,y1,x2,y2
    std::string detections_path = "detections.csv";
};

struct AppConfig {
    DetectionConfig detection;
    TrackerConfig tracker;
    CounterConfig counter;
    SchedulerConfig scheduler;
    DaylightConfig daylight;
    CaptureConfig capture;
    SinkConfig sinks;
    LoggingConfig logging;
    ReplayConfig replay;

    /**
     * @brief Check value ranges across all sections
     *
     * @throws ConfigError naming the first offending key
     */
    void validate() const;
};

const char* toString(LineAxis axis);
const char* toString(DaylightWindow window);

} // namespace boatcount
