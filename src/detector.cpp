#include "boatcount/detector.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace boatcount {

ReplayDetector::ReplayDetector(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open detection file " + path);
    }

    std::string line;
    std::size_t line_no = 0;
    std::size_t rows = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (line.rfind("frame", 0) == 0) continue;   // header

        for (char& c : line) {
            if (c == ',') c = ' ';
        }
        std::istringstream fields(line);
        std::uint64_t frame;
        RawDetection det;
        float x1, y1, x2, y2;
        if (!(fields >> frame >> det.class_id >> det.confidence >> x1 >> y1 >> x2 >> y2)) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": malformed detection row");
        }
        det.tlbr << x1, y1, x2, y2;
        frames_[frame].push_back(det);
        ++rows;
    }
    spdlog::info("Replaying {} detections over {} frames from {}", rows, frames_.size(), path);
}

std::vector<RawDetection> ReplayDetector::detect(const cv::Mat& /*frame*/) {
    auto it = frames_.find(next_frame_++);
    if (it == frames_.end()) {
        return {};
    }
    return it->second;
}

} // namespace boatcount
