// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/tracking/visual_tracker.hpp>
#include <iostream>

namespace anoncpp::tracking {

KCFTracker::KCFTracker()
    : tracker_(cv::TrackerKCF::create())
    , initialized_(false)
{
}

bool KCFTracker::init(const cv::Mat& frame, const BoundingBox& box) {
    initialized_ = false;
    if (frame.empty() || box.w <= 0 || box.h <= 0) {
        return false;
    }

    // Degenerate boxes make KCF raise inside its feature extraction
    try {
        tracker_->init(frame, box.to_rect());
        initialized_ = true;
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: KCF init failed: " << e.what() << std::endl;
    }
    return initialized_;
}

bool KCFTracker::update(const cv::Mat& frame, BoundingBox& box) {
    if (!initialized_ || frame.empty()) {
        return false;
    }

    cv::Rect rect;
    bool found = false;
    try {
        found = tracker_->update(frame, rect);
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: KCF update failed: " << e.what() << std::endl;
        return false;
    }
    if (!found || rect.width <= 0 || rect.height <= 0) {
        return false;
    }

    box = BoundingBox::from_rect(rect);
    return true;
}

TrackerFactory kcf_tracker_factory() {
    return [] { return std::make_unique<KCFTracker>(); };
}

} // namespace anoncpp::tracking
