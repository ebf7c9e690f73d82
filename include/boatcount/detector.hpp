#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "boatcount/detection.hpp"

namespace boatcount {

/**
 * @brief Object detector collaborator: one frame in, raw boxes out
 */
class Detector {
public:
    virtual ~Detector() = default;
    virtual std::vector<RawDetection> detect(const cv::Mat& frame) = 0;
};

/**
 * @brief Replays recorded detections from a CSV file, one call per frame
 *
 * Rows are `frame,class_id,confidence,x1,y1,x2,y2`; a header line and blank lines
 * are skipped. Frames are numbered from 0 in call order and frames without rows
 * yield no detections.
 */
class ReplayDetector : public Detector {
public:
    /**
     * @throws std::runtime_error if the file cannot be read or a row is malformed
     */
    explicit ReplayDetector(const std::string& path);

    std::vector<RawDetection> detect(const cv::Mat& frame) override;

    std::size_t frameCount() const { return frames_.size(); }
    std::uint64_t getNextFrame() const { return next_frame_; }

private:
    std::map<std::uint64_t, std::vector<RawDetection>> frames_;
    std::uint64_t next_frame_ = 0;
};

} // namespace boatcount
