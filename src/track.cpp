#include "boatcount/track.hpp"

namespace boatcount {

const char* toString(TrackState state) {
    switch (state) {
        case TrackState::Tentative: return "tentative";
        case TrackState::Confirmed: return "confirmed";
        case TrackState::Lost: return "lost";
        case TrackState::Deleted: return "deleted";
    }
    return "unknown";
}

Track::Track(const Detection& detection, int track_id, int n_init, int max_age, const KalmanFilter& kf)
    : track_id_(track_id)
    , hits_(1)
    , age_(1)
    , time_since_update_(0)
    , n_init_(n_init)
    , max_age_(max_age)
    , state_(TrackState::Tentative)
    , confidence_(detection.getConfidence())
    , kf_(kf) {

    auto [mean, covariance] = kf_.initiate(detection.toXYAH());
    mean_ = mean;
    covariance_ = covariance;

    if (hits_ >= n_init_) {
        state_ = TrackState::Confirmed;
    }
}

Eigen::Vector4f Track::toTLWH() const {
    Eigen::Vector4f ret = mean_.head(4);
    ret(2) *= ret(3);
    ret.head(2) -= ret.tail(2) / 2;
    return ret;
}

Eigen::Vector4f Track::toTLBR() const {
    Eigen::Vector4f ret = toTLWH();
    ret.tail(2) += ret.head(2);
    return ret;
}

void Track::predict() {
    auto [new_mean, new_covariance] = kf_.predict(mean_, covariance_);
    mean_ = new_mean;
    covariance_ = new_covariance;
    age_ += 1;
    time_since_update_ += 1;
}

void Track::update(const Detection& detection) {
    auto [new_mean, new_covariance] = kf_.update(mean_, covariance_, detection.toXYAH());
    mean_ = new_mean;
    covariance_ = new_covariance;
    confidence_ = detection.getConfidence();

    hits_ += 1;
    time_since_update_ = 0;
    if (state_ == TrackState::Tentative && hits_ >= n_init_) {
        state_ = TrackState::Confirmed;
    } else if (state_ == TrackState::Lost) {
        state_ = TrackState::Confirmed;
    }
}

void Track::markMissed() {
    if (time_since_update_ > max_age_) {
        state_ = TrackState::Deleted;
    } else if (state_ == TrackState::Confirmed) {
        state_ = TrackState::Lost;
    }
}

} // namespace boatcount
