#include "boatcount/snapshot_writer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

namespace boatcount {

SnapshotWriter::SnapshotWriter(std::string directory, bool crop)
    : directory_(std::move(directory))
    , crop_(crop) {
    if (directory_.empty()) {
        throw std::invalid_argument("snapshot directory must not be empty");
    }
    std::filesystem::create_directories(directory_);
}

void SnapshotWriter::setFrame(const cv::Mat& frame, std::uint64_t frame_index) {
    frame_ = frame;
    frame_index_ = frame_index;
}

void SnapshotWriter::publish(const CrossingEvent& event) {
    if (frame_.empty() || frame_index_ != event.frame_index) {
        throw std::runtime_error(fmt::format("no frame held for frame {}", event.frame_index));
    }

    cv::Mat image = frame_;
    if (crop_) {
        const int x1 = std::max(0, static_cast<int>(std::floor(event.tlbr(0))));
        const int y1 = std::max(0, static_cast<int>(std::floor(event.tlbr(1))));
        const int x2 = std::min(frame_.cols, static_cast<int>(std::ceil(event.tlbr(2))));
        const int y2 = std::min(frame_.rows, static_cast<int>(std::ceil(event.tlbr(3))));
        // A box predicted off-frame leaves nothing to crop; keep the full frame
        if (x2 > x1 && y2 > y1) {
            image = frame_(cv::Rect(x1, y1, x2 - x1, y2 - y1));
        }
    }

    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        event.timestamp.time_since_epoch()).count() % 1000000;
    const std::string file = fmt::format("boat_{}_{:%Y%m%d_%H%M%S}_{:06d}.jpg", event.track_id,
        fmt::localtime(std::chrono::system_clock::to_time_t(event.timestamp)), micros);
    const std::string path = (std::filesystem::path(directory_) / file).string();

    if (!cv::imwrite(path, image)) {
        throw std::runtime_error("cannot write snapshot " + path);
    }
    last_path_ = path;
    spdlog::debug("Snapshot saved {}", file);
}

} // namespace boatcount
