#include "boatcount/kalman_filter.hpp"
#include <algorithm>
#include <stdexcept>

namespace boatcount {

namespace {

constexpr int kMeasurementDim = 4;

// Floor on the height used to scale noise, so a collapsing box keeps a positive-definite covariance
float noiseScale(float height) {
    return std::max(height, 1.0f);
}

} // namespace

KalmanFilter::KalmanFilter(float dt) {
    if (!(dt > 0.0f)) {
        throw std::invalid_argument("Kalman filter time step must be positive");
    }

    motion_mat_ = Eigen::MatrixXf::Identity(2 * kMeasurementDim, 2 * kMeasurementDim);
    for (int i = 0; i < kMeasurementDim; ++i) {
        motion_mat_(i, kMeasurementDim + i) = dt;
    }

    update_mat_ = Eigen::MatrixXf::Identity(kMeasurementDim, 2 * kMeasurementDim);

    // Motion and observation uncertainty, relative to the box height
    std_weight_position_ = 1.0f / 20.0f;
    std_weight_velocity_ = 1.0f / 160.0f;
}

std::pair<Eigen::VectorXf, Eigen::MatrixXf> KalmanFilter::initiate(const Eigen::Vector4f& measurement) const {
    Eigen::VectorXf mean = Eigen::VectorXf::Zero(2 * kMeasurementDim);
    mean.head(kMeasurementDim) = measurement;

    const float h = noiseScale(measurement(3));
    Eigen::VectorXf std(2 * kMeasurementDim);
    std <<
        2 * std_weight_position_ * h,
        2 * std_weight_position_ * h,
        1e-2f,
        2 * std_weight_position_ * h,
        10 * std_weight_velocity_ * h,
        10 * std_weight_velocity_ * h,
        1e-5f,
        10 * std_weight_velocity_ * h;

    Eigen::MatrixXf covariance = std.array().square().matrix().asDiagonal();
    return {mean, covariance};
}

std::pair<Eigen::VectorXf, Eigen::MatrixXf> KalmanFilter::predict(
    const Eigen::VectorXf& mean, const Eigen::MatrixXf& covariance) const {

    const float h = noiseScale(mean(3));
    Eigen::VectorXf std_pos(kMeasurementDim);
    std_pos <<
        std_weight_position_ * h,
        std_weight_position_ * h,
        1e-2f,
        std_weight_position_ * h;

    Eigen::VectorXf std_vel(kMeasurementDim);
    std_vel <<
        std_weight_velocity_ * h,
        std_weight_velocity_ * h,
        1e-5f,
        std_weight_velocity_ * h;

    Eigen::VectorXf std_concat(2 * kMeasurementDim);
    std_concat << std_pos, std_vel;

    Eigen::MatrixXf motion_cov = std_concat.array().square().matrix().asDiagonal();
    Eigen::VectorXf new_mean = motion_mat_ * mean;
    Eigen::MatrixXf new_covariance = motion_mat_ * covariance * motion_mat_.transpose() + motion_cov;

    return {new_mean, new_covariance};
}

std::pair<Eigen::VectorXf, Eigen::MatrixXf> KalmanFilter::project(
    const Eigen::VectorXf& mean, const Eigen::MatrixXf& covariance) const {

    const float h = noiseScale(mean(3));
    Eigen::VectorXf std(kMeasurementDim);
    std <<
        std_weight_position_ * h,
        std_weight_position_ * h,
        1e-1f,
        std_weight_position_ * h;

    Eigen::MatrixXf innovation_cov = std.array().square().matrix().asDiagonal();
    Eigen::VectorXf mean_proj = update_mat_ * mean;
    Eigen::MatrixXf covariance_proj = update_mat_ * covariance * update_mat_.transpose() + innovation_cov;

    return {mean_proj, covariance_proj};
}

std::pair<Eigen::VectorXf, Eigen::MatrixXf> KalmanFilter::update(
    const Eigen::VectorXf& mean, const Eigen::MatrixXf& covariance,
    const Eigen::Vector4f& measurement) const {

    auto [projected_mean, projected_cov] = project(mean, covariance);

    // Compute Kalman gain using Cholesky decomposition
    Eigen::LLT<Eigen::MatrixXf> llt(projected_cov);
    if (llt.info() != Eigen::Success) {
        throw std::runtime_error("Kalman innovation covariance is not positive definite");
    }
    Eigen::MatrixXf kalman_gain = (llt.solve(update_mat_ * covariance.transpose())).transpose();

    Eigen::VectorXf innovation = measurement - projected_mean;
    Eigen::VectorXf new_mean = mean + kalman_gain * innovation;
    Eigen::MatrixXf new_covariance = covariance - kalman_gain * projected_cov * kalman_gain.transpose();

    return {new_mean, new_covariance};
}

} // namespace boatcount
