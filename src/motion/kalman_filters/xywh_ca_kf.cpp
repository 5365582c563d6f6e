// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/motion/kalman_filters/xywh_ca_kf.hpp>
#include <Eigen/Cholesky>
#include <algorithm>
#include <cmath>

namespace anoncpp::motion {

namespace {
constexpr int kPosition = 0;
constexpr int kVelocity = 4;
constexpr int kAcceleration = 8;
}

KalmanFilterXYWHCA::KalmanFilterXYWHCA(float dt)
    : F(kDimX, kDimX)
    , H(kDimZ, kDimX)
    , P(kDimX, kDimX)
    , Q(kDimX, kDimX)
    , R(kDimZ, kDimZ)
    , dt_(dt)
    , x_(kDimX)
    , I_(kDimX, kDimX)
{
    // p' = p + v*dt + a*dt^2/2
    // v' = v + a*dt
    // a' = a
    F.setIdentity();
    for (int i = 0; i < kDimZ; ++i) {
        F(kPosition + i, kVelocity + i) = dt_;
        F(kPosition + i, kAcceleration + i) = 0.5f * dt_ * dt_;
        F(kVelocity + i, kAcceleration + i) = dt_;
    }

    // Observe position only
    H.setZero();
    for (int i = 0; i < kDimZ; ++i) {
        H(i, kPosition + i) = 1.0f;
    }

    Q.setIdentity();
    Q.block(kPosition, kPosition, kDimZ, kDimZ) *= kPositionNoise;
    Q.block(kVelocity, kVelocity, kDimZ, kDimZ) *= kVelocityNoise;
    Q.block(kAcceleration, kAcceleration, kDimZ, kDimZ) *= kAccelerationNoise;

    R.setIdentity();
    R *= kMeasurementNoise;

    x_.setZero();
    P.setIdentity();
    I_.setIdentity();
}

Eigen::VectorXf KalmanFilterXYWHCA::to_measurement(const BoundingBox& box) {
    Eigen::VectorXf z(kDimZ);
    z << static_cast<float>(box.x), static_cast<float>(box.y),
         static_cast<float>(box.w), static_cast<float>(box.h);
    return z;
}

void KalmanFilterXYWHCA::initiate(const BoundingBox& box) {
    x_.setZero();
    x_.segment(kPosition, kDimZ) = to_measurement(box);
    P.setIdentity();
}

void KalmanFilterXYWHCA::predict() {
    x_ = F * x_;
    P = F * P * F.transpose() + Q;
}

void KalmanFilterXYWHCA::update(const BoundingBox& measurement) {
    Eigen::VectorXf z = to_measurement(measurement);

    // Innovation and its covariance
    Eigen::VectorXf y = z - H * x_;
    Eigen::MatrixXf S = H * P * H.transpose() + R;

    Eigen::MatrixXf K;
    Eigen::LLT<Eigen::MatrixXf> chol(S);
    if (chol.info() == Eigen::Success) {
        K = P * H.transpose() * chol.solve(Eigen::MatrixXf::Identity(kDimZ, kDimZ));
    } else {
        Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXf> cod(S);
        K = P * H.transpose() * cod.pseudoInverse();
    }

    x_ = x_ + K * y;

    // Joseph form keeps P symmetric positive semi-definite
    Eigen::MatrixXf I_KH = I_ - K * H;
    P = I_KH * P * I_KH.transpose() + K * R * K.transpose();
}

BoxMotionState KalmanFilterXYWHCA::state() const {
    BoxMotionState s;
    s.position = x_.segment<4>(kPosition);
    s.velocity = x_.segment<4>(kVelocity);
    s.acceleration = x_.segment<4>(kAcceleration);
    return s;
}

void KalmanFilterXYWHCA::set_state(const BoxMotionState& state) {
    x_.segment<4>(kPosition) = state.position;
    x_.segment<4>(kVelocity) = state.velocity;
    x_.segment<4>(kAcceleration) = state.acceleration;
}

BoundingBox KalmanFilterXYWHCA::box() const {
    BoundingBox b;
    b.x = static_cast<int>(std::lround(x_(kPosition + 0)));
    b.y = static_cast<int>(std::lround(x_(kPosition + 1)));
    b.w = std::max(0, static_cast<int>(std::lround(x_(kPosition + 2))));
    b.h = std::max(0, static_cast<int>(std::lround(x_(kPosition + 3))));
    return b;
}

} // namespace anoncpp::motion
