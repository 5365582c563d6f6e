// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/types.hpp>
#include <opencv2/core.hpp>
#include <opencv2/tracking.hpp>
#include <functional>
#include <memory>

namespace anoncpp::tracking {

/**
 * Single-object visual tracker
 */
class VisualTracker {
public:
    virtual ~VisualTracker() = default;

    /**
     * Start following `box` on `frame`
     * @return false if the tracker could not be initialised
     */
    virtual bool init(const cv::Mat& frame, const BoundingBox& box) = 0;

    /**
     * Locate the object on the next frame
     * @return false when the object is lost; `box` is left untouched then
     */
    virtual bool update(const cv::Mat& frame, BoundingBox& box) = 0;
};

using TrackerFactory = std::function<std::unique_ptr<VisualTracker>()>;

/**
 * Kernelized correlation filter tracker (cv::TrackerKCF)
 */
class KCFTracker : public VisualTracker {
public:
    KCFTracker();

    bool init(const cv::Mat& frame, const BoundingBox& box) override;
    bool update(const cv::Mat& frame, BoundingBox& box) override;

private:
    cv::Ptr<cv::TrackerKCF> tracker_;
    bool initialized_;
};

TrackerFactory kcf_tracker_factory();

} // namespace anoncpp::tracking
