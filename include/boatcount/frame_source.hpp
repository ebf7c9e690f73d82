#pragma once

#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include "boatcount/config.hpp"
#include "boatcount/scheduler.hpp"

namespace boatcount {

/**
 * @brief A capture device that also yields frames
 */
class FrameSource : public CaptureDevice {
public:
    /**
     * @brief Grab the next frame
     *
     * @return false on a read failure or at the end of a finite source
     */
    virtual bool read(cv::Mat& frame) = 0;

    // True for sources that end, such as video files; a read failure is end of stream
    virtual bool isFinite() const = 0;
};

/**
 * @brief FrameSource over cv::VideoCapture: a camera index or a video file
 */
class VideoSource : public FrameSource {
public:
    explicit VideoSource(const CaptureConfig& config);
    ~VideoSource() override;

    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    bool open() override;
    void release() override;
    bool isOpen() const override;
    std::string describe() const override;

    bool read(cv::Mat& frame) override;
    bool isFinite() const override { return camera_index_ < 0; }

private:
    CaptureConfig config_;
    int camera_index_;          // -1 for a file source
    cv::VideoCapture capture_;
};

/**
 * @brief Region-of-interest mask applied before detection
 *
 * Loaded as grayscale and binarized at 127. Without a mask file the full frame is used.
 */
class RoiMask {
public:
    RoiMask() = default;

    /**
     * @brief Load the mask, or leave it empty when the file does not exist
     *
     * @throws std::runtime_error if the file exists but cannot be decoded
     */
    static RoiMask load(const std::string& path);

    /**
     * @brief Zero every pixel outside the mask; returns the input when empty
     *
     * The mask is resized to the frame size when they differ.
     */
    cv::Mat apply(const cv::Mat& frame);

    bool empty() const { return mask_.empty(); }

private:
    explicit RoiMask(cv::Mat mask);

    cv::Mat mask_;
};

} // namespace boatcount
