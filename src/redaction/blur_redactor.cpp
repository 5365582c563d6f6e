// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/redaction/blur_redactor.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace anoncpp::redaction {

namespace {
constexpr int kMinKernel = 3;
constexpr double kFallbackFps = 30.0;
}

BlurRedactor::BlurRedactor(const RedactionConfig& config)
    : config_(config)
{
    config_.validate();
}

cv::Rect BlurRedactor::expanded_region(const BoundingBox& box, const cv::Size& frame_size,
                                       double scale_factor) {
    double cx = box.x + box.w / 2.0;
    double cy = box.y + box.h / 2.0;
    double half_w = box.w * scale_factor / 2.0;
    double half_h = box.h * scale_factor / 2.0;

    int x1 = static_cast<int>(std::floor(cx - half_w));
    int y1 = static_cast<int>(std::floor(cy - half_h));
    int x2 = static_cast<int>(std::ceil(cx + half_w));
    int y2 = static_cast<int>(std::ceil(cy + half_h));

    cv::Rect region(x1, y1, std::max(0, x2 - x1), std::max(0, y2 - y1));
    return region & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

int BlurRedactor::kernel_for(const cv::Rect& region) const {
    int kernel = std::min({config_.kernel_size, region.width, region.height});
    if (kernel % 2 == 0) {
        kernel -= 1;
    }
    return kernel >= kMinKernel ? kernel : 0;
}

int BlurRedactor::redact(cv::Mat& frame, const std::vector<BoundingBox>& boxes) const {
    int blurred = 0;
    for (const auto& box : boxes) {
        cv::Rect region = region_for(box, frame.size());
        int kernel = kernel_for(region);
        if (kernel == 0) {
            continue;
        }
        cv::Mat roi = frame(region);
        cv::GaussianBlur(roi, roi, cv::Size(kernel, kernel), 0);
        blurred++;
    }
    return blurred;
}

int BlurRedactor::redact_video(const LocalizationResult& result,
                               const std::string& output_path) const {
    cv::VideoCapture capture(result.video_path);
    if (!capture.isOpened()) {
        throw std::runtime_error("Cannot open video: " + result.video_path);
    }

    double fps = result.native_fps > 0.0 ? result.native_fps : capture.get(cv::CAP_PROP_FPS);
    if (!(fps > 0.0)) {
        fps = kFallbackFps;
    }

    std::unordered_map<int, const std::vector<BoundingBox>*> boxes_by_frame;
    boxes_by_frame.reserve(result.detections.size());
    for (const auto& record : result.detections) {
        boxes_by_frame[record.frame_index] = &record.boxes;
    }

    std::filesystem::path out(output_path);
    if (out.has_parent_path()) {
        std::filesystem::create_directories(out.parent_path());
    }

    const std::string& fourcc = config_.fourcc;
    cv::VideoWriter writer;
    int frame_index = 0;
    cv::Mat frame;
    while (capture.read(frame) && !frame.empty()) {
        if (!writer.isOpened()) {
            writer.open(output_path,
                        cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]),
                        fps, frame.size(), frame.channels() == 3);
            if (!writer.isOpened()) {
                throw std::runtime_error("Cannot open video writer: " + output_path);
            }
        }

        auto it = boxes_by_frame.find(frame_index);
        if (it != boxes_by_frame.end()) {
            redact(frame, *it->second);
        }
        writer.write(frame);
        frame_index++;
    }

    return frame_index;
}

} // namespace anoncpp::redaction
