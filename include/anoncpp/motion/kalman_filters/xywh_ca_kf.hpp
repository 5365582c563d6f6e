// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/types.hpp>
#include <Eigen/Dense>

namespace anoncpp::motion {

/**
 * Named view of the 12-dimensional filter state.
 * Each vector is ordered (x, y, w, h).
 */
struct BoxMotionState {
    Eigen::Vector4f position = Eigen::Vector4f::Zero();
    Eigen::Vector4f velocity = Eigen::Vector4f::Zero();
    Eigen::Vector4f acceleration = Eigen::Vector4f::Zero();
};

/**
 * Constant-acceleration Kalman filter over a top-left (x, y, w, h) box.
 * State: [x, y, w, h, vx, vy, vw, vh, ax, ay, aw, ah] (12D)
 * Observation: [x, y, w, h] (4D)
 *
 * Noise scales were tuned on face footage and are kept fixed:
 * process noise 0.01 (position), 0.5 (velocity), 2.0 (acceleration),
 * measurement noise 0.1.
 */
class KalmanFilterXYWHCA {
public:
    static constexpr int kDimX = 12;
    static constexpr int kDimZ = 4;

    static constexpr float kPositionNoise = 0.01f;
    static constexpr float kVelocityNoise = 0.5f;
    static constexpr float kAccelerationNoise = 2.0f;
    static constexpr float kMeasurementNoise = 0.1f;

    explicit KalmanFilterXYWHCA(float dt = 1.0f);

    // State transition matrix F (12x12)
    Eigen::MatrixXf F;

    // Measurement matrix H (4x12)
    Eigen::MatrixXf H;

    // Covariance matrix P (12x12)
    Eigen::MatrixXf P;

    // Process noise Q (12x12)
    Eigen::MatrixXf Q;

    // Measurement noise R (4x4)
    Eigen::MatrixXf R;

    /**
     * Reset the filter at a box with zero velocity and acceleration
     */
    void initiate(const BoundingBox& box);

    /**
     * Project the state one step forward without a measurement
     */
    void predict();

    /**
     * Correct the state with a measured box
     */
    void update(const BoundingBox& measurement);

    BoxMotionState state() const;
    void set_state(const BoxMotionState& state);

    /**
     * Current position estimate rounded to pixels, with negative sizes clamped to 0
     */
    BoundingBox box() const;

private:
    static Eigen::VectorXf to_measurement(const BoundingBox& box);

    float dt_;

    // State vector x (12x1)
    Eigen::VectorXf x_;

    // Identity matrix
    Eigen::MatrixXf I_;
};

} // namespace anoncpp::motion
