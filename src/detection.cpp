#include "boatcount/detection.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace boatcount {

Detection::Detection(const Eigen::Vector4f& tlbr, float confidence)
    : tlbr_(tlbr)
    , confidence_(confidence) {
}

Eigen::Vector4f Detection::toTLWH() const {
    Eigen::Vector4f ret = tlbr_;
    ret.segment<2>(2) -= ret.segment<2>(0);  // Max corner to width and height
    return ret;
}

Eigen::Vector4f Detection::toXYAH() const {
    Eigen::Vector4f ret = toTLWH();
    ret.segment<2>(0) += ret.segment<2>(2) / 2.0f;  // Convert top-left to center coordinates
    ret(2) /= ret(3);  // width / height for aspect ratio
    return ret;
}

bool Detection::isValid() const {
    if (!tlbr_.allFinite() || !std::isfinite(confidence_)) {
        return false;
    }
    if (tlbr_(0) >= tlbr_(2) || tlbr_(1) >= tlbr_(3)) {
        return false;
    }
    return confidence_ >= 0.0f && confidence_ <= 1.0f;
}

std::vector<Detection> filterDetections(const std::vector<RawDetection>& raw,
                                        int class_id,
                                        float min_confidence,
                                        std::size_t* rejected) {
    std::vector<Detection> detections;
    detections.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        const auto& det = raw[i];
        if (class_id >= 0 && det.class_id != class_id) continue;

        Detection detection(det.tlbr, det.confidence);
        if (!detection.isValid()) {
            spdlog::warn("Rejected malformed detection {}: bbox={},{},{},{} conf={}",
                i, det.tlbr(0), det.tlbr(1), det.tlbr(2), det.tlbr(3), det.confidence);
            if (rejected) {
                ++*rejected;
            }
            continue;
        }

        if (det.confidence < min_confidence) {
            spdlog::debug("Skipping low confidence detection {} ({:.2f})", i, det.confidence);
            continue;
        }
        detections.push_back(detection);
    }
    return detections;
}

} // namespace boatcount
