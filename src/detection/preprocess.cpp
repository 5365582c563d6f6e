// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/detection/preprocess.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace anoncpp::detection {

bool is_grayscale(const cv::Mat& frame, double tolerance) {
    if (frame.empty()) {
        return false;
    }
    if (frame.channels() == 1) {
        return true;
    }

    std::vector<cv::Mat> channels;
    cv::split(frame, channels);
    if (channels.size() < 3) {
        return false;
    }

    cv::Mat diff_bg, diff_gr;
    cv::absdiff(channels[0], channels[1], diff_bg);
    cv::absdiff(channels[1], channels[2], diff_gr);
    return cv::mean(diff_bg)[0] < tolerance && cv::mean(diff_gr)[0] < tolerance;
}

cv::Mat resize_to_max_side(const cv::Mat& frame, int max_side,
                           double& scale_x, double& scale_y) {
    scale_x = 1.0;
    scale_y = 1.0;
    int longer = std::max(frame.cols, frame.rows);
    if (longer <= max_side || longer == 0) {
        return frame;
    }

    double factor = static_cast<double>(max_side) / longer;
    int new_w = std::max(1, static_cast<int>(std::lround(frame.cols * factor)));
    int new_h = std::max(1, static_cast<int>(std::lround(frame.rows * factor)));

    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_AREA);
    scale_x = static_cast<double>(frame.cols) / new_w;
    scale_y = static_cast<double>(frame.rows) / new_h;
    return resized;
}

cv::Mat enhance_grayscale(const cv::Mat& frame, const LocalizerConfig& config) {
    cv::Mat gray;
    if (frame.channels() == 1) {
        gray = frame;
    } else {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    }

    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(config.clahe_clip_limit,
                                               cv::Size(config.clahe_tile, config.clahe_tile));
    cv::Mat equalized;
    clahe->apply(gray, equalized);

    cv::Mat blurred;
    cv::GaussianBlur(equalized, blurred, cv::Size(0, 0), config.sharpen_sigma);

    // 8-bit output saturates to [0, 255]
    cv::Mat sharpened;
    cv::addWeighted(equalized, 1.0 + config.sharpen_amount,
                    blurred, -config.sharpen_amount, 0.0, sharpened);

    cv::Mat bgr;
    cv::cvtColor(sharpened, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

PreparedFrame prepare_for_detection(const cv::Mat& frame, bool grayscale,
                                    const LocalizerConfig& config) {
    PreparedFrame prepared;
    cv::Mat resized = resize_to_max_side(frame, config.max_detection_side,
                                        prepared.scale_x, prepared.scale_y);

    if (grayscale) {
        prepared.image = enhance_grayscale(resized, config);
    } else if (resized.channels() == 1) {
        cv::cvtColor(resized, prepared.image, cv::COLOR_GRAY2BGR);
    } else {
        prepared.image = resized;
    }
    return prepared;
}

BoundingBox rescale_box(const cv::Rect2f& box, double scale_x, double scale_y,
                        const cv::Size& frame_size) {
    int x1 = static_cast<int>(std::lround(box.x * scale_x));
    int y1 = static_cast<int>(std::lround(box.y * scale_y));
    int x2 = static_cast<int>(std::lround((box.x + box.width) * scale_x));
    int y2 = static_cast<int>(std::lround((box.y + box.height) * scale_y));

    x1 = std::clamp(x1, 0, frame_size.width);
    y1 = std::clamp(y1, 0, frame_size.height);
    x2 = std::clamp(x2, 0, frame_size.width);
    y2 = std::clamp(y2, 0, frame_size.height);

    return {x1, y1, std::max(0, x2 - x1), std::max(0, y2 - y1)};
}

} // namespace anoncpp::detection
