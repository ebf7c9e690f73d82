#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include "boatcount/clock.hpp"
#include "boatcount/config.hpp"
#include "boatcount/detector.hpp"
#include "boatcount/event_sink.hpp"
#include "boatcount/frame_processor.hpp"
#include "boatcount/frame_source.hpp"
#include "boatcount/scheduler.hpp"
#include "boatcount/snapshot_writer.hpp"

namespace boatcount {

struct RunSummary {
    std::uint64_t frames = 0;
    std::uint64_t counted = 0;
    std::uint64_t read_failures = 0;
    std::uint64_t frame_errors = 0;     // Frames whose detection or processing threw
    std::uint64_t sink_failures = 0;
    bool end_of_stream = false;
    bool cancelled = false;
};

/**
 * @brief The frame loop: schedule, read, mask, detect, track, count, publish
 *
 * All collaborators are borrowed and must outlive the pipeline. The frame
 * processor is created from the size of the first frame read.
 */
class Pipeline {
public:
    Pipeline(const AppConfig& config,
             FrameSource& source,
             Detector& detector,
             EventDispatcher& dispatcher,
             AcquisitionScheduler& scheduler,
             Clock& clock,
             const CancellationToken& cancel);

    // Optional; receives every frame before it is processed
    void setSnapshotWriter(std::shared_ptr<SnapshotWriter> writer) { snapshots_ = std::move(writer); }
    void setMask(RoiMask mask) { mask_ = std::move(mask); }

    /**
     * @brief Run until cancelled or until a finite source ends
     *
     * The capture is released on return.
     */
    RunSummary run();

    const FrameProcessor* getProcessor() const { return processor_.get(); }

private:
    // Returns false when the run should end
    bool step(RunSummary& summary);
    void processFrame(const cv::Mat& frame, RunSummary& summary);
    void resetTracking(const char* reason);

    AppConfig config_;
    FrameSource& source_;
    Detector& detector_;
    EventDispatcher& dispatcher_;
    AcquisitionScheduler& scheduler_;
    Clock& clock_;
    const CancellationToken& cancel_;

    RoiMask mask_;
    std::shared_ptr<SnapshotWriter> snapshots_;
    std::unique_ptr<FrameProcessor> processor_;
    std::uint64_t frame_index_ = 0;
    int consecutive_read_failures_ = 0;
};

} // namespace boatcount
