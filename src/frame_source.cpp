#include "boatcount/frame_source.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace boatcount {

namespace {

int parseCameraIndex(const std::string& source) {
    // A number is a camera index, anything else a video file path
    if (!source.empty() && source.find_first_not_of("0123456789") == std::string::npos) {
        try {
            return std::stoi(source);
        } catch (const std::out_of_range&) {
            throw ConfigError("capture.source: camera index out of range");
        }
    }
    return -1;
}

} // namespace

VideoSource::VideoSource(const CaptureConfig& config)
    : config_(config)
    , camera_index_(parseCameraIndex(config.source)) {
}

VideoSource::~VideoSource() {
    release();
}

bool VideoSource::open() {
    if (capture_.isOpened()) {
        return true;
    }

    bool ok = camera_index_ >= 0 ? capture_.open(camera_index_) : capture_.open(config_.source);
    if (!ok || !capture_.isOpened()) {
        capture_.release();
        return false;
    }

    if (camera_index_ >= 0) {
        capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
    }
    spdlog::debug("{} delivers {}x{}", describe(),
        capture_.get(cv::CAP_PROP_FRAME_WIDTH), capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
    return true;
}

void VideoSource::release() {
    if (capture_.isOpened()) {
        capture_.release();
    }
}

bool VideoSource::isOpen() const {
    return capture_.isOpened();
}

std::string VideoSource::describe() const {
    return camera_index_ >= 0 ? "camera " + config_.source : "file " + config_.source;
}

bool VideoSource::read(cv::Mat& frame) {
    if (!capture_.isOpened() || !capture_.read(frame) || frame.empty()) {
        return false;
    }
    // Files are delivered at their native size
    if (!isFinite() && (frame.cols != config_.width || frame.rows != config_.height)) {
        cv::resize(frame, frame, cv::Size(config_.width, config_.height));
    }
    return true;
}

RoiMask::RoiMask(cv::Mat mask)
    : mask_(std::move(mask)) {
}

RoiMask RoiMask::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::info("No mask found - using full frame");
        return RoiMask();
    }

    cv::Mat gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (gray.empty()) {
        throw std::runtime_error("cannot decode mask " + path);
    }
    cv::Mat binary;
    cv::threshold(gray, binary, 127, 255, cv::THRESH_BINARY);
    spdlog::info("Mask loaded from {} ({}x{})", path, binary.cols, binary.rows);
    return RoiMask(binary);
}

cv::Mat RoiMask::apply(const cv::Mat& frame) {
    if (mask_.empty() || frame.empty()) {
        return frame;
    }
    if (mask_.size() != frame.size()) {
        cv::resize(mask_, mask_, frame.size(), 0, 0, cv::INTER_NEAREST);
    }
    cv::Mat masked;
    cv::bitwise_and(frame, frame, masked, mask_);
    return masked;
}

} // namespace boatcount
