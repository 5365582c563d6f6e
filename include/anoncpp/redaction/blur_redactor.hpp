// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/types.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace anoncpp::redaction {

/**
 * Gaussian-blurs face boxes, each grown about its center by a safety factor
 */
class BlurRedactor {
public:
    /**
     * @throws std::invalid_argument if the kernel is even or the scale is not positive
     */
    explicit BlurRedactor(const RedactionConfig& config = RedactionConfig());

    /**
     * Box scaled by `scale_factor` about its center, clipped to the frame.
     * Empty when the box lies outside the frame.
     */
    static cv::Rect expanded_region(const BoundingBox& box, const cv::Size& frame_size,
                                    double scale_factor);

    cv::Rect region_for(const BoundingBox& box, const cv::Size& frame_size) const {
        return expanded_region(box, frame_size, config_.scale_factor);
    }

    /**
     * Largest odd kernel not above the configured one that fits the region;
     * 0 when the region is too small to blur
     */
    int kernel_for(const cv::Rect& region) const;

    /**
     * Blur every box of one frame in place
     * @return Number of regions blurred
     */
    int redact(cv::Mat& frame, const std::vector<BoundingBox>& boxes) const;

    /**
     * Re-read `result.video_path`, blur the boxes of each frame and write the
     * output video at the native frame rate
     * @return Number of frames written
     * @throws std::runtime_error if the input or output cannot be opened
     */
    int redact_video(const LocalizationResult& result, const std::string& output_path) const;

    const RedactionConfig& config() const { return config_; }

private:
    RedactionConfig config_;
};

} // namespace anoncpp::redaction
