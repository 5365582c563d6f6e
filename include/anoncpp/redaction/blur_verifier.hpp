// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/types.hpp>
#include <anoncpp/video/frame_source.hpp>
#include <opencv2/core.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace anoncpp::redaction {

/**
 * Checks that blurred regions are smooth enough to be unrecognizable.
 * Sharpness is the variance of the Laplacian of the grayscale region; the
 * video passes when the mean over all regions is below the threshold.
 */
class BlurVerifier {
public:
    explicit BlurVerifier(const RedactionConfig& config = RedactionConfig());

    static double laplacian_variance(const cv::Mat& region);

    /**
     * @throws std::runtime_error if the video cannot be opened
     */
    BlurVerdict verify(const std::string& blurred_video_path,
                       const std::vector<DetectionRecord>& detections) const;

    BlurVerdict verify(video::FrameSource& blurred_frames,
                       const std::vector<DetectionRecord>& detections) const;

private:
    RedactionConfig config_;
};

void print_blur_verdict(std::ostream& os, const BlurVerdict& verdict);

} // namespace anoncpp::redaction
