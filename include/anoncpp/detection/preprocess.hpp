// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/types.hpp>
#include <opencv2/core.hpp>

namespace anoncpp::detection {

/**
 * Frame prepared for the detector together with the factors that map
 * detector coordinates back to the original frame
 */
struct PreparedFrame {
    cv::Mat image;
    // original / prepared, per axis
    double scale_x = 1.0;
    double scale_y = 1.0;
};

/**
 * True when the frame is single-channel or its colour channels differ by
 * less than `tolerance` grey levels on average
 */
bool is_grayscale(const cv::Mat& frame, double tolerance = 1.0);

/**
 * Downscale so the longer side is at most `max_side`. Smaller frames are
 * returned unchanged.
 * Rounding the resized size makes the two axis factors differ slightly.
 * @param scale_x Receives original / resized width
 * @param scale_y Receives original / resized height
 */
cv::Mat resize_to_max_side(const cv::Mat& frame, int max_side,
                           double& scale_x, double& scale_y);

/**
 * CLAHE followed by unsharp masking
 * (1 + amount) * image - amount * gaussian(image), saturated to [0, 255].
 * Returns a 3-channel BGR image for the detector.
 */
cv::Mat enhance_grayscale(const cv::Mat& frame, const LocalizerConfig& config);

PreparedFrame prepare_for_detection(const cv::Mat& frame, bool grayscale,
                                    const LocalizerConfig& config);

/**
 * Map a detector box back to the original frame and clip it to the frame
 */
BoundingBox rescale_box(const cv::Rect2f& box, double scale_x, double scale_y,
                        const cv::Size& frame_size);

} // namespace anoncpp::detection
