#include "boatcount/pipeline.hpp"
#include <spdlog/spdlog.h>

namespace boatcount {

Pipeline::Pipeline(const AppConfig& config,
                   FrameSource& source,
                   Detector& detector,
                   EventDispatcher& dispatcher,
                   AcquisitionScheduler& scheduler,
                   Clock& clock,
                   const CancellationToken& cancel)
    : config_(config)
    , source_(source)
    , detector_(detector)
    , dispatcher_(dispatcher)
    , scheduler_(scheduler)
    , clock_(clock)
    , cancel_(cancel) {
}

RunSummary Pipeline::run() {
    spdlog::info("Pipeline starting on {}", source_.describe());

    RunSummary summary;
    while (step(summary)) {
    }
    scheduler_.stop();

    summary.sink_failures = dispatcher_.getFailures();
    const std::uint64_t total = processor_ ? processor_->getCounter().getTotal() : 0;
    spdlog::info("Pipeline stopped after {} frames: {} boats counted, {} read failures, {} frame errors, {} sink failures",
        summary.frames, total, summary.read_failures, summary.frame_errors, summary.sink_failures);
    return summary;
}

bool Pipeline::step(RunSummary& summary) {
    if (cancel_.stopRequested()) {
        summary.cancelled = true;
        return false;
    }

    switch (scheduler_.tick()) {
        case TickResult::Cancelled:
            summary.cancelled = true;
            return false;
        case TickResult::Sleeping:
            resetTracking("capture sleeping");
            return true;
        case TickResult::AcquireFailed:
            return true;
        case TickResult::Ready:
            break;
    }

    cv::Mat frame;
    if (!source_.read(frame)) {
        ++summary.read_failures;
        if (source_.isFinite()) {
            spdlog::info("End of stream on {}", source_.describe());
            summary.end_of_stream = true;
            return false;
        }

        ++consecutive_read_failures_;
        spdlog::warn("Frame read failed on {} [{}/{}]",
            source_.describe(), consecutive_read_failures_, config_.capture.max_read_failures);
        if (consecutive_read_failures_ >= config_.capture.max_read_failures) {
            spdlog::error("Too many read failures on {} - releasing capture", source_.describe());
            source_.release();
            consecutive_read_failures_ = 0;
            resetTracking("capture released");
        } else if (!clock_.waitFor(config_.capture.read_retry_delay, cancel_)) {
            summary.cancelled = true;
            return false;
        }
        return true;
    }

    consecutive_read_failures_ = 0;
    processFrame(frame, summary);
    return true;
}

void Pipeline::processFrame(const cv::Mat& frame, RunSummary& summary) {
    const FrameStamp stamp{frame_index_++, clock_.wallNow(), clock_.monoNow()};
    ++summary.frames;

    try {
        if (!processor_) {
            processor_ = std::make_unique<FrameProcessor>(config_, frame.cols, frame.rows, dispatcher_);
        }
        const cv::Mat masked = mask_.apply(frame);
        const auto raw = detector_.detect(masked);
        if (snapshots_) {
            snapshots_->setFrame(frame, stamp.index);
        }

        const FrameResult result = processor_->process(raw, stamp);
        summary.counted += result.events.size();
        if (result.rejected > 0) {
            spdlog::debug("Frame {}: {} malformed detections rejected", stamp.index, result.rejected);
        }
    } catch (const std::exception& e) {
        ++summary.frame_errors;
        spdlog::error("Frame {} failed: {}", stamp.index, e.what());
    }
}

void Pipeline::resetTracking(const char* reason) {
    if (!processor_) {
        return;
    }
    const std::size_t dropped = processor_->resetTracking();
    if (dropped > 0) {
        spdlog::info("Dropped {} tracks ({})", dropped, reason);
    }
}

} // namespace boatcount
