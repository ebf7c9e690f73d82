#pragma once

#include <Eigen/Dense>
#include <tuple>
#include <utility>
#include <vector>
#include "boatcount/config.hpp"
#include "boatcount/detection.hpp"
#include "boatcount/kalman_filter.hpp"
#include "boatcount/matching.hpp"
#include "boatcount/track.hpp"

namespace boatcount {

/**
 * @brief A confirmed track as surfaced to downstream consumers for one frame
 */
struct TrackedObject {
    int track_id;
    Eigen::Vector4f tlbr;       // Estimated box (min x, min y, max x, max y)
    Eigen::Vector2f center;
    float confidence;           // Confidence of the detection matched this frame
};

class Tracker {
public:
    /**
     * @brief Construct a new Tracker object
     *
     * @param max_iou_distance Maximum IOU distance (1 - IoU) accepted for a match
     * @param max_age Maximum number of missed frames before track deletion
     * @param n_init Number of detections before track confirmation
     */
    Tracker(float max_iou_distance = 0.7f,
            int max_age = 30,
            int n_init = 3);

    explicit Tracker(const TrackerConfig& config);

    /**
     * @brief Propagate track state distributions one time step forward
     *
     * update() already predicts; call this only to coast tracks through a frame
     * that is not passed to update().
     */
    void predict();

    /**
     * @brief Predict, associate, update and manage tracks for one frame
     *
     * An empty detection list is valid: all tracks age and none are created.
     *
     * @param detections Detections at the current time step
     * @return std::vector<TrackedObject> Confirmed tracks matched in this frame
     */
    std::vector<TrackedObject> update(const std::vector<Detection>& detections);

    /**
     * @brief Drop every track, e.g. after a capture gap
     *
     * The dropped ids are reported by getDeletedIds() until the next update().
     * Ids are not reused.
     */
    void clear();

    // Getters
    const std::vector<Track>& getTracks() const { return tracks_; }
    const std::vector<int>& getDeletedIds() const { return deleted_ids_; }
    int getNextId() const { return next_id_; }

private:
    /**
     * @brief Create a new tentative track for an unmatched detection
     *
     * @param detection Detection to create track from
     */
    void initiateTrack(const Detection& detection);

    /**
     * @brief Match tracks and detections by IoU
     *
     * @param detections List of detections
     * @return std::tuple<matches, unmatched_tracks, unmatched_detections>
     */
    matching::MatchResult match(const std::vector<Detection>& detections);

private:
    // Track management
    std::vector<Track> tracks_;
    std::vector<int> deleted_ids_;
    int next_id_;
    KalmanFilter kf_;

    // Track parameters
    float max_iou_distance_;
    int max_age_;
    int n_init_;
};

} // namespace boatcount
