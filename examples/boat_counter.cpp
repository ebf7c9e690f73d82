#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "boatcount/clock.hpp"
#include "boatcount/config_loader.hpp"
#include "boatcount/daylight.hpp"
#include "boatcount/detector.hpp"
#include "boatcount/event_sink.hpp"
#include "boatcount/frame_source.hpp"
#include "boatcount/logging.hpp"
#include "boatcount/pipeline.hpp"
#include "boatcount/scheduler.hpp"
#include "boatcount/snapshot_writer.hpp"

using namespace boatcount;

namespace {

CancellationToken g_cancel;

void handleSignal(int /*signum*/) {
    g_cancel.requestStop();
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.toml]" << std::endl;
        return 1;
    }
    const std::string config_path = argc == 2 ? argv[1] : "boatcount.toml";

    try {
        const AppConfig config = loadConfig(config_path);
        setupLogging(config.logging);
        spdlog::info("Loaded {}", config_path);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        SystemClock clock;
        VideoSource source(config.capture);
        ReplayDetector detector(config.replay.detections_path);

        EventDispatcher dispatcher;
        if (config.sinks.log_events) {
            dispatcher.addSink(std::make_shared<LogSink>());
        }
        if (config.sinks.csv_enabled) {
            dispatcher.addSink(std::make_shared<CsvLedgerSink>(config.sinks.csv_path));
        }
        std::shared_ptr<SnapshotWriter> snapshots;
        if (config.sinks.snapshot_enabled) {
            snapshots = std::make_shared<SnapshotWriter>(config.sinks.snapshot_dir, config.sinks.snapshot_crop);
            dispatcher.addSink(snapshots);
        }

        AcquisitionScheduler::DaylightPredicate is_daytime = [](WallTime) { return true; };
        if (config.daylight.enabled) {
            auto daylight = std::make_shared<SolarDaylight>(config.daylight);
            is_daytime = [daylight](WallTime t) { return daylight->isDaytime(t); };
            spdlog::info("Daylight window {} at ({:.3f}, {:.3f})",
                toString(config.daylight.window), config.daylight.latitude, config.daylight.longitude);
        }
        AcquisitionScheduler scheduler(config.scheduler, source, is_daytime, clock, g_cancel);

        Pipeline pipeline(config, source, detector, dispatcher, scheduler, clock, g_cancel);
        pipeline.setMask(RoiMask::load(config.capture.mask_path));
        pipeline.setSnapshotWriter(snapshots);

        const RunSummary summary = pipeline.run();
        spdlog::info("Done: {} boats counted in {} frames{}", summary.counted, summary.frames,
            summary.cancelled ? " (interrupted)" : "");
    } catch (const ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
