#pragma once

#include <Eigen/Dense>
#include "boatcount/kalman_filter.hpp"
#include "boatcount/detection.hpp"

namespace boatcount {

enum class TrackState {
    Tentative = 1,
    Confirmed = 2,
    Lost = 3,
    Deleted = 4
};

const char* toString(TrackState state);

class Track {
public:
    /**
     * @brief Construct a new Track object
     *
     * @param detection Initial detection
     * @param track_id Unique track identifier
     * @param n_init Number of detections before track confirmation
     * @param max_age Maximum number of consecutive misses before track deletion
     * @param kf Motion model configured by the owning tracker
     */
    Track(const Detection& detection, int track_id, int n_init, int max_age, const KalmanFilter& kf);

    /**
     * @brief Get current position in bounding box format (top left x, top left y, width, height)
     */
    Eigen::Vector4f toTLWH() const;

    /**
     * @brief Get current position in bounding box format (min x, min y, max x, max y)
     */
    Eigen::Vector4f toTLBR() const;

    /**
     * @brief Center of the estimated box
     */
    Eigen::Vector2f center() const { return mean_.head<2>(); }

    /**
     * @brief Estimated center velocity in pixels per frame
     */
    Eigen::Vector2f velocity() const { return mean_.segment<2>(4); }

    /**
     * @brief Propagate the state distribution to the current time step using Kalman prediction
     */
    void predict();

    /**
     * @brief Perform Kalman filter measurement update step
     *
     * @param detection Associated detection
     */
    void update(const Detection& detection);

    /**
     * @brief Mark this track as missed (no association at the current time step)
     */
    void markMissed();

    // State query methods
    bool isTentative() const { return state_ == TrackState::Tentative; }
    bool isConfirmed() const { return state_ == TrackState::Confirmed; }
    bool isLost() const { return state_ == TrackState::Lost; }
    bool isDeleted() const { return state_ == TrackState::Deleted; }

    // Getters
    int getTrackId() const { return track_id_; }
    int getHits() const { return hits_; }
    int getAge() const { return age_; }
    int getTimeSinceUpdate() const { return time_since_update_; }
    TrackState getState() const { return state_; }
    float getConfidence() const { return confidence_; }
    const Eigen::VectorXf& getMean() const { return mean_; }
    const Eigen::MatrixXf& getCovariance() const { return covariance_; }

private:
    // Track parameters
    int track_id_;
    int hits_;
    int age_;
    int time_since_update_;
    int n_init_;
    int max_age_;

    // Track state
    TrackState state_;
    float confidence_;

    // Kalman filter state
    KalmanFilter kf_;
    Eigen::VectorXf mean_;
    Eigen::MatrixXf covariance_;
};

} // namespace boatcount
