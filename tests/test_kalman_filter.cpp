#include <gtest/gtest.h>
#include <stdexcept>
#include "boatcount/kalman_filter.hpp"

using namespace boatcount;

TEST(KalmanFilterTest, InitiateCentersOnMeasurementWithZeroVelocity) {
    KalmanFilter kf;
    auto [mean, covariance] = kf.initiate(Eigen::Vector4f(100, 50, 2.0f, 40));

    ASSERT_EQ(mean.size(), 8);
    EXPECT_FLOAT_EQ(mean(0), 100);
    EXPECT_FLOAT_EQ(mean(1), 50);
    EXPECT_FLOAT_EQ(mean(2), 2.0f);
    EXPECT_FLOAT_EQ(mean(3), 40);
    EXPECT_TRUE(mean.tail<4>().isZero());
    EXPECT_EQ(covariance.rows(), 8);
    EXPECT_GT(covariance(0, 0), 0.0f);
}

TEST(KalmanFilterTest, PredictMovesByVelocityAndGrowsUncertainty) {
    KalmanFilter kf;
    auto [mean, covariance] = kf.initiate(Eigen::Vector4f(100, 50, 2.0f, 40));
    mean(4) = 5.0f;
    mean(5) = -2.0f;

    auto [predicted, predicted_cov] = kf.predict(mean, covariance);
    EXPECT_FLOAT_EQ(predicted(0), 105);
    EXPECT_FLOAT_EQ(predicted(1), 48);
    EXPECT_GT(predicted_cov(0, 0), covariance(0, 0));
}

TEST(KalmanFilterTest, VelocityConvergesOnConstantMotion) {
    KalmanFilter kf;
    auto [mean, covariance] = kf.initiate(Eigen::Vector4f(0, 100, 1.5f, 60));

    for (int frame = 1; frame <= 20; ++frame) {
        std::tie(mean, covariance) = kf.predict(mean, covariance);
        std::tie(mean, covariance) = kf.update(mean, covariance, Eigen::Vector4f(4.0f * frame, 100, 1.5f, 60));
    }
    EXPECT_NEAR(mean(4), 4.0f, 0.5f);
    EXPECT_NEAR(mean(0), 80.0f, 2.0f);
    EXPECT_NEAR(mean(5), 0.0f, 0.1f);
}

TEST(KalmanFilterTest, RejectsNonPositiveTimeStep) {
    EXPECT_THROW(KalmanFilter(0.0f), std::invalid_argument);
    EXPECT_THROW(KalmanFilter(-1.0f), std::invalid_argument);
}
