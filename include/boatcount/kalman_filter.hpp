#pragma once

#include <Eigen/Dense>
#include <utility>

namespace boatcount {

/**
 * @brief Constant-velocity Kalman filter over image-space bounding boxes
 *
 * State space is 8D: (x, y, a, h, vx, vy, va, vh) where (x,y) is the center position,
 * a is the aspect ratio, h is height, and v* are their respective velocities.
 * The filter itself is stateless; each track owns its mean and covariance.
 */
class KalmanFilter {
public:
    /**
     * @brief Construct a new Kalman Filter object
     *
     * @param dt Time step between two consecutive frames, in frames
     */
    explicit KalmanFilter(float dt = 1.0f);

    /**
     * @brief Initialize track from unassociated measurement
     *
     * @param measurement Bounding box coordinates (x, y, a, h)
     * @return std::pair<Eigen::VectorXf, Eigen::MatrixXf> Mean and covariance of the state distribution
     */
    std::pair<Eigen::VectorXf, Eigen::MatrixXf> initiate(const Eigen::Vector4f& measurement) const;

    /**
     * @brief Run Kalman filter prediction step
     *
     * @param mean Mean vector of the object state
     * @param covariance Covariance matrix of the object state
     * @return std::pair<Eigen::VectorXf, Eigen::MatrixXf> Predicted mean and covariance
     */
    std::pair<Eigen::VectorXf, Eigen::MatrixXf> predict(const Eigen::VectorXf& mean,
                                                        const Eigen::MatrixXf& covariance) const;

    /**
     * @brief Project state distribution to measurement space
     *
     * @param mean State's mean vector
     * @param covariance State's covariance matrix
     * @return std::pair<Eigen::VectorXf, Eigen::MatrixXf> Projected mean and covariance
     */
    std::pair<Eigen::VectorXf, Eigen::MatrixXf> project(const Eigen::VectorXf& mean,
                                                        const Eigen::MatrixXf& covariance) const;

    /**
     * @brief Run Kalman filter correction step
     *
     * @param mean Predicted state's mean vector
     * @param covariance State's covariance matrix
     * @param measurement Measurement vector (x, y, a, h)
     * @return std::pair<Eigen::VectorXf, Eigen::MatrixXf> Corrected mean and covariance
     */
    std::pair<Eigen::VectorXf, Eigen::MatrixXf> update(const Eigen::VectorXf& mean,
                                                       const Eigen::MatrixXf& covariance,
                                                       const Eigen::Vector4f& measurement) const;

private:
    Eigen::MatrixXf motion_mat_;     // State transition matrix
    Eigen::MatrixXf update_mat_;     // Measurement matrix
    float std_weight_position_;      // Standard deviation multiplier for position
    float std_weight_velocity_;      // Standard deviation multiplier for velocity
};

} // namespace boatcount
