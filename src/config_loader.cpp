#include <toml++/toml.h>
#include "boatcount/config_loader.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace boatcount {

namespace {

std::string keyName(std::string_view section, std::string_view key) {
    return std::string(section) + "." + std::string(key);
}

/**
 * @brief Overwrite out with tbl[key] when present
 *
 * @throws ConfigError if the key holds a value of another type
 */
template <typename T>
bool read_optional(const toml::table& tbl, std::string_view section, std::string_view key, T& out) {
    const auto* node = tbl.get(key);
    if (!node) {
        return false;
    }
    const auto value = node->value<T>();
    if (!value) {
        throw ConfigError(keyName(section, key) + ": invalid value type");
    }
    out = *value;
    return true;
}

const toml::table* section(const toml::table& root, std::string_view name) {
    const auto* node = root.get(name);
    if (!node) {
        return nullptr;
    }
    const auto* tbl = node->as_table();
    if (!tbl) {
        throw ConfigError(std::string(name) + ": expected a table");
    }
    return tbl;
}

std::size_t readCount(const toml::table& tbl, std::string_view sec, std::string_view key, std::size_t current) {
    std::int64_t value = static_cast<std::int64_t>(current);
    read_optional(tbl, sec, key, value);
    if (value < 0) {
        throw ConfigError(keyName(sec, key) + ": must not be negative");
    }
    return static_cast<std::size_t>(value);
}

std::chrono::milliseconds readSeconds(const toml::table& tbl, std::string_view sec, std::string_view key,
                                      std::chrono::milliseconds current) {
    double seconds = std::chrono::duration<double>(current).count();
    if (read_optional(tbl, sec, key, seconds) && !std::isfinite(seconds)) {
        throw ConfigError(keyName(sec, key) + ": must be finite");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

void loadDetection(const toml::table& root, DetectionConfig& cfg) {
    const auto* tbl = section(root, "detection");
    if (!tbl) return;
    read_optional(*tbl, "detection", "class_id", cfg.class_id);
    read_optional(*tbl, "detection", "min_confidence", cfg.min_confidence);
}

void loadTracker(const toml::table& root, TrackerConfig& cfg) {
    const auto* tbl = section(root, "tracker");
    if (!tbl) return;
    read_optional(*tbl, "tracker", "max_age", cfg.max_age);
    read_optional(*tbl, "tracker", "n_init", cfg.n_init);
    read_optional(*tbl, "tracker", "iou_threshold", cfg.iou_threshold);
}

void loadCounter(const toml::table& root, CounterConfig& cfg) {
    const auto* tbl = section(root, "counter");
    if (!tbl) return;

    std::string axis;
    if (read_optional(*tbl, "counter", "line_axis", axis)) {
        if (axis == "vertical") {
            cfg.line.axis = LineAxis::Vertical;
        } else if (axis == "horizontal") {
            cfg.line.axis = LineAxis::Horizontal;
        } else {
            throw ConfigError("counter.line_axis: expected \"vertical\" or \"horizontal\"");
        }
    }
    read_optional(*tbl, "counter", "line_position", cfg.line.position);
    read_optional(*tbl, "counter", "line_relative", cfg.line.relative);
    cfg.history_size = readCount(*tbl, "counter", "history_size", cfg.history_size);
    read_optional(*tbl, "counter", "min_distance", cfg.min_distance);
    cfg.cooldown = readSeconds(*tbl, "counter", "cooldown_sec", cfg.cooldown);
}

void loadScheduler(const toml::table& root, SchedulerConfig& cfg) {
    const auto* tbl = section(root, "scheduler");
    if (!tbl) return;

    std::int64_t sleep = cfg.sleep_duration.count();
    read_optional(*tbl, "scheduler", "sleep_sec", sleep);
    cfg.sleep_duration = std::chrono::seconds(sleep);
    read_optional(*tbl, "scheduler", "max_open_attempts", cfg.max_open_attempts);
    read_optional(*tbl, "scheduler", "backoff_base", cfg.backoff_base);
    cfg.max_backoff = readSeconds(*tbl, "scheduler", "max_backoff_sec", cfg.max_backoff);
}

void loadDaylight(const toml::table& root, DaylightConfig& cfg) {
    const auto* tbl = section(root, "daylight");
    if (!tbl) return;

    read_optional(*tbl, "daylight", "enabled", cfg.enabled);
    read_optional(*tbl, "daylight", "latitude", cfg.latitude);
    read_optional(*tbl, "daylight", "longitude", cfg.longitude);

    std::string window;
    if (read_optional(*tbl, "daylight", "window", window)) {
        if (window == "civil") {
            cfg.window = DaylightWindow::Civil;
        } else if (window == "official") {
            cfg.window = DaylightWindow::Official;
        } else {
            throw ConfigError("daylight.window: expected \"civil\" or \"official\"");
        }
    }
}

void loadCapture(const toml::table& root, CaptureConfig& cfg) {
    const auto* tbl = section(root, "capture");
    if (!tbl) return;

    // A camera index may be written as a bare integer
    std::int64_t index = 0;
    const auto* source = tbl->get("source");
    if (source && source->is_integer()) {
        read_optional(*tbl, "capture", "source", index);
        cfg.source = std::to_string(index);
    } else {
        read_optional(*tbl, "capture", "source", cfg.source);
    }
    read_optional(*tbl, "capture", "width", cfg.width);
    read_optional(*tbl, "capture", "height", cfg.height);
    read_optional(*tbl, "capture", "mask_path", cfg.mask_path);
    read_optional(*tbl, "capture", "max_read_failures", cfg.max_read_failures);

    std::int64_t retry_ms = cfg.read_retry_delay.count();
    read_optional(*tbl, "capture", "read_retry_ms", retry_ms);
    if (retry_ms < 0) {
        throw ConfigError("capture.read_retry_ms: must not be negative");
    }
    cfg.read_retry_delay = std::chrono::milliseconds(retry_ms);
}

void loadSinks(const toml::table& root, SinkConfig& cfg) {
    const auto* tbl = section(root, "sinks");
    if (!tbl) return;
    read_optional(*tbl, "sinks", "log_events", cfg.log_events);
    read_optional(*tbl, "sinks", "snapshot_enabled", cfg.snapshot_enabled);
    read_optional(*tbl, "sinks", "snapshot_dir", cfg.snapshot_dir);
    read_optional(*tbl, "sinks", "snapshot_crop", cfg.snapshot_crop);
    read_optional(*tbl, "sinks", "csv_enabled", cfg.csv_enabled);
    read_optional(*tbl, "sinks", "csv_path", cfg.csv_path);
}

void loadLogging(const toml::table& root, LoggingConfig& cfg) {
    const auto* tbl = section(root, "logging");
    if (!tbl) return;
    read_optional(*tbl, "logging", "directory", cfg.directory);
    read_optional(*tbl, "logging", "file_name", cfg.file_name);
    read_optional(*tbl, "logging", "level", cfg.level);
    cfg.max_file_size = readCount(*tbl, "logging", "max_file_size", cfg.max_file_size);
    cfg.max_files = readCount(*tbl, "logging", "max_files", cfg.max_files);
    read_optional(*tbl, "logging", "console", cfg.console);
}

void loadReplay(const toml::table& root, ReplayConfig& cfg) {
    const auto* tbl = section(root, "replay");
    if (!tbl) return;
    read_optional(*tbl, "replay", "detections_path", cfg.detections_path);
}

AppConfig fromTable(const toml::table& root) {
    AppConfig cfg;
    loadDetection(root, cfg.detection);
    loadTracker(root, cfg.tracker);
    loadCounter(root, cfg.counter);
    loadScheduler(root, cfg.scheduler);
    loadDaylight(root, cfg.daylight);
    loadCapture(root, cfg.capture);
    loadSinks(root, cfg.sinks);
    loadLogging(root, cfg.logging);
    loadReplay(root, cfg.replay);
    cfg.validate();
    return cfg;
}

} // namespace

AppConfig loadConfig(const std::string& path) {
    toml::table root;
    try {
        root = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigError(fmt::format("{}: {} (line {})", path, e.description(), e.source().begin.line));
    }
    return fromTable(root);
}

AppConfig parseConfig(std::string_view text) {
    toml::table root;
    try {
        root = toml::parse(text);
    } catch (const toml::parse_error& e) {
        throw ConfigError(fmt::format("{} (line {})", e.description(), e.source().begin.line));
    }
    return fromTable(root);
}

} // namespace boatcount
