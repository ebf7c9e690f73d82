#include "boatcount/tracker.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace boatcount {

Tracker::Tracker(float max_iou_distance,
                 int max_age,
                 int n_init)
    : next_id_(1)
    , max_iou_distance_(max_iou_distance)
    , max_age_(max_age)
    , n_init_(n_init) {
    if (max_iou_distance_ < 0.0f || max_iou_distance_ >= 1.0f) {
        throw std::invalid_argument("max_iou_distance must be within [0, 1)");
    }
    if (max_age_ < 1 || n_init_ < 1) {
        throw std::invalid_argument("max_age and n_init must be at least 1");
    }
}

Tracker::Tracker(const TrackerConfig& config)
    : Tracker(1.0f - config.iou_threshold, config.max_age, config.n_init) {
}

void Tracker::predict() {
    for (auto& track : tracks_) {
        track.predict();
    }
}

std::vector<TrackedObject> Tracker::update(const std::vector<Detection>& detections) {
    deleted_ids_.clear();
    predict();

    auto [matches, unmatched_tracks, unmatched_detections] = match(detections);

    // Update track set
    for (const auto& [track_idx, detection_idx] : matches) {
        tracks_[track_idx].update(detections[detection_idx]);
    }

    for (int track_idx : unmatched_tracks) {
        tracks_[track_idx].markMissed();
    }

    for (int detection_idx : unmatched_detections) {
        initiateTrack(detections[detection_idx]);
    }

    // Remove deleted tracks
    for (const auto& track : tracks_) {
        if (track.isDeleted()) {
            spdlog::debug("Track {} deleted after {} missed frames (hits={})",
                track.getTrackId(), track.getTimeSinceUpdate(), track.getHits());
            deleted_ids_.push_back(track.getTrackId());
        }
    }
    tracks_.erase(
        std::remove_if(tracks_.begin(), tracks_.end(),
                      [](const Track& t) { return t.isDeleted(); }),
        tracks_.end());

    std::vector<TrackedObject> confirmed;
    for (const auto& track : tracks_) {
        if (!track.isConfirmed() || track.getTimeSinceUpdate() > 0) continue;
        confirmed.push_back({track.getTrackId(), track.toTLBR(), track.center(), track.getConfidence()});
    }
    return confirmed;
}

void Tracker::clear() {
    deleted_ids_.clear();
    for (const auto& track : tracks_) {
        deleted_ids_.push_back(track.getTrackId());
    }
    tracks_.clear();
}

void Tracker::initiateTrack(const Detection& detection) {
    tracks_.emplace_back(detection, next_id_, n_init_, max_age_, kf_);
    spdlog::debug("Track {} created (tentative)", next_id_);
    next_id_ += 1;
}

matching::MatchResult Tracker::match(const std::vector<Detection>& detections) {
    return matching::minCostMatching(matching::iouCost, max_iou_distance_,
                                     tracks_, detections);
}

} // namespace boatcount
