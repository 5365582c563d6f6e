// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/redaction/blur_verifier.hpp>
#include <anoncpp/redaction/blur_redactor.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iomanip>
#include <unordered_map>

namespace anoncpp::redaction {

BlurVerifier::BlurVerifier(const RedactionConfig& config)
    : config_(config)
{
    config_.validate();
}

double BlurVerifier::laplacian_variance(const cv::Mat& region) {
    if (region.empty()) {
        return 0.0;
    }

    cv::Mat gray;
    if (region.channels() == 1) {
        gray = region;
    } else {
        cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return stddev[0] * stddev[0];
}

BlurVerdict BlurVerifier::verify(const std::string& blurred_video_path,
                                 const std::vector<DetectionRecord>& detections) const {
    video::VideoFileSource source(blurred_video_path);
    return verify(source, detections);
}

BlurVerdict BlurVerifier::verify(video::FrameSource& blurred_frames,
                                 const std::vector<DetectionRecord>& detections) const {
    BlurVerdict verdict;
    verdict.threshold = config_.max_laplacian_variance;

    std::unordered_map<int, const std::vector<BoundingBox>*> boxes_by_frame;
    for (const auto& record : detections) {
        if (!record.boxes.empty()) {
            boxes_by_frame[record.frame_index] = &record.boxes;
        }
    }

    // Regions the redactor skipped as too small are skipped here as well
    const BlurRedactor geometry(config_);

    double variance_sum = 0.0;
    int frame_index = 0;
    cv::Mat frame;
    while (blurred_frames.next(frame)) {
        auto it = boxes_by_frame.find(frame_index++);
        if (it == boxes_by_frame.end()) {
            continue;
        }

        bool measured = false;
        for (const auto& box : *it->second) {
            cv::Rect region = geometry.region_for(box, frame.size());
            if (geometry.kernel_for(region) == 0) {
                continue;
            }
            double variance = laplacian_variance(frame(region));
            variance_sum += variance;
            verdict.max_variance = std::max(verdict.max_variance, variance);
            verdict.regions_measured++;
            measured = true;
        }
        if (measured) {
            verdict.frames_measured++;
        }
    }

    verdict.average_variance = verdict.regions_measured > 0
        ? variance_sum / verdict.regions_measured
        : 0.0;
    verdict.pass = verdict.regions_measured == 0 ||
                   verdict.average_variance < verdict.threshold;
    return verdict;
}

void print_blur_verdict(std::ostream& os, const BlurVerdict& verdict) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(2);
    os << "Blur verification: " << (verdict.pass ? "PASS" : "FAIL") << "\n";
    os << "  Regions measured:   " << verdict.regions_measured
       << " in " << verdict.frames_measured << " frames\n";
    os << "  Laplacian variance: " << verdict.average_variance
       << " avg, " << verdict.max_variance << " max (threshold " << verdict.threshold << ")\n";

    os.flags(flags);
    os.precision(precision);
}

} // namespace anoncpp::redaction
