// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/motion/kalman_filters/xywh_ca_kf.hpp>
#include <anoncpp/tracking/visual_tracker.hpp>
#include <memory>

namespace anoncpp::tracking {

/**
 * One tracked face: a visual tracker plus a motion filter.
 * Created from a detector box; tracks carry no identity across detector passes.
 */
class TrackState {
public:
    TrackState(std::unique_ptr<VisualTracker> tracker,
               const cv::Mat& frame,
               const BoundingBox& box);

    /**
     * Run the visual tracker on `frame`
     * @param measured Receives the tracker box on success
     */
    bool track(const cv::Mat& frame, BoundingBox& measured);

    /**
     * Advance the filter and correct it with a measured box
     * @return Corrected estimate
     */
    BoundingBox correct(const BoundingBox& measured);

    /**
     * Advance the filter with no measurement
     * @return Predicted estimate
     */
    BoundingBox predict();

    BoundingBox box() const { return kf_.box(); }
    motion::BoxMotionState motion() const { return kf_.state(); }
    bool tracker_ready() const { return tracker_ready_; }

private:
    std::unique_ptr<VisualTracker> tracker_;
    motion::KalmanFilterXYWHCA kf_;
    bool tracker_ready_;
};

} // namespace anoncpp::tracking
