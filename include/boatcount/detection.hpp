#pragma once

#include <Eigen/Dense>
#include <vector>

namespace boatcount {

/**
 * @brief Detector output before class and confidence filtering
 */
struct RawDetection {
    Eigen::Vector4f tlbr;   // (x1, y1, x2, y2) in pixels
    float confidence;
    int class_id;
};

class Detection {
public:
    /**
     * @brief Construct a new Detection object
     *
     * @param tlbr Bounding box in format (min x, min y, max x, max y)
     * @param confidence Detector confidence score
     */
    Detection(const Eigen::Vector4f& tlbr, float confidence);

    /**
     * @brief Convert bounding box to format (top left x, top left y, width, height)
     */
    Eigen::Vector4f toTLWH() const;

    /**
     * @brief Convert bounding box to format (center x, center y, aspect ratio, height)
     *
     * @return Eigen::Vector4f Bounding box in XYAH format, the Kalman measurement space
     */
    Eigen::Vector4f toXYAH() const;

    /**
     * @brief Check the box is finite, non-degenerate and the confidence lies in [0, 1]
     */
    bool isValid() const;

    // Getters
    const Eigen::Vector4f& getTLBR() const { return tlbr_; }
    float getConfidence() const { return confidence_; }

private:
    Eigen::Vector4f tlbr_;      // Bounding box (min x, min y, max x, max y)
    float confidence_;          // Detector confidence score
};

/**
 * @brief Keep detections of the requested class above the confidence threshold
 *
 * Malformed boxes are dropped with a warning; the remaining detections of the
 * frame are still returned.
 *
 * @param raw Detector output for one frame
 * @param class_id Class to keep, negative keeps every class
 * @param min_confidence Minimum confidence (inclusive)
 * @param rejected Optional counter of detections dropped as malformed
 */
std::vector<Detection> filterDetections(const std::vector<RawDetection>& raw,
                                        int class_id,
                                        float min_confidence,
                                        std::size_t* rejected = nullptr);

} // namespace boatcount
