#pragma once

#include <cstdint>
#include <string>
#include <opencv2/core.hpp>
#include "boatcount/event_sink.hpp"

namespace boatcount {

/**
 * @brief Saves a JPEG per counted crossing
 *
 * The pipeline hands over each frame before processing it; publish() writes that
 * frame (or the track's crop) to `<dir>/boat_<track>_<timestamp>.jpg`.
 */
class SnapshotWriter : public EventSink {
public:
    SnapshotWriter(std::string directory, bool crop);

    std::string name() const override { return "snapshot"; }

    // Frame the next events refer to; the image is shared, not copied
    void setFrame(const cv::Mat& frame, std::uint64_t frame_index);

    /**
     * @throws std::runtime_error if no matching frame is held or the write fails
     */
    void publish(const CrossingEvent& event) override;

    const std::string& getLastPath() const { return last_path_; }

private:
    std::string directory_;
    bool crop_;
    cv::Mat frame_;
    std::uint64_t frame_index_ = 0;
    std::string last_path_;
};

} // namespace boatcount
