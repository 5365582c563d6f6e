// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/tracking/track_state.hpp>
#include <stdexcept>
#include <utility>

namespace anoncpp::tracking {

TrackState::TrackState(std::unique_ptr<VisualTracker> tracker,
                       const cv::Mat& frame,
                       const BoundingBox& box)
    : tracker_(std::move(tracker))
    , kf_()
    , tracker_ready_(false)
{
    if (!tracker_) {
        throw std::invalid_argument("TrackState requires a visual tracker");
    }
    kf_.initiate(box);
    tracker_ready_ = tracker_->init(frame, box);
}

bool TrackState::track(const cv::Mat& frame, BoundingBox& measured) {
    if (!tracker_ready_) {
        return false;
    }
    return tracker_->update(frame, measured);
}

BoundingBox TrackState::correct(const BoundingBox& measured) {
    kf_.predict();
    kf_.update(measured);
    return kf_.box();
}

BoundingBox TrackState::predict() {
    kf_.predict();
    return kf_.box();
}

} // namespace anoncpp::tracking
