// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/detection/face_detector.hpp>
#include <anoncpp/detection/onnx_face_detector.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace anoncpp::detection {

YuNetDetector::YuNetDetector(const std::string& model_path,
                             float score_threshold,
                             float nms_threshold,
                             int top_k)
    : input_size_(320, 320)
{
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Face detector model not found: " + model_path);
    }

    try {
        detector_ = cv::FaceDetectorYN::create(model_path, "", input_size_,
                                               score_threshold, nms_threshold, top_k);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Failed to load YuNet model: " + std::string(e.what()));
    }
    if (detector_.empty()) {
        throw std::runtime_error("Failed to load YuNet model: " + model_path);
    }
}

std::vector<cv::Rect2f> YuNetDetector::detect(const cv::Mat& image) {
    std::vector<cv::Rect2f> boxes;
    if (image.empty()) {
        return boxes;
    }

    // Rows: [x, y, w, h, 5 landmarks (x, y), score]
    cv::Mat faces;
    try {
        if (image.size() != input_size_) {
            detector_->setInputSize(image.size());
            input_size_ = image.size();
        }
        detector_->detect(image, faces);
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: YuNet detection failed: " << e.what() << std::endl;
        return boxes;
    }

    boxes.reserve(faces.rows);
    for (int i = 0; i < faces.rows; ++i) {
        boxes.emplace_back(faces.at<float>(i, 0), faces.at<float>(i, 1),
                           faces.at<float>(i, 2), faces.at<float>(i, 3));
    }
    return boxes;
}

std::unique_ptr<FaceDetector> create_face_detector(const LocalizerConfig& config) {
    if (config.detector_backend == "yunet") {
        return std::make_unique<YuNetDetector>(config.detector_model,
                                               config.score_threshold,
                                               config.nms_threshold,
                                               config.top_k);
    }
    if (config.detector_backend == "onnx") {
        return std::make_unique<ONNXFaceDetector>(config.detector_model,
                                                  config.score_threshold,
                                                  config.nms_threshold,
                                                  config.top_k);
    }
    throw std::invalid_argument("Unknown detector backend: " + config.detector_backend);
}

} // namespace anoncpp::detection
