// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <memory>
#include <string>
#include <vector>

namespace anoncpp::detection {

/**
 * Base face detector interface
 * Boxes are returned in the coordinates of the image passed to detect().
 * A frame without faces, or one the backend fails on, yields an empty
 * vector; backends log the failure as a warning instead of throwing.
 */
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<cv::Rect2f> detect(const cv::Mat& image) = 0;
};

/**
 * YuNet detector through cv::FaceDetectorYN
 */
class YuNetDetector : public FaceDetector {
public:
    /**
     * @param model_path YuNet ONNX weights
     * @throws std::runtime_error if the model file is missing or cannot be loaded
     */
    YuNetDetector(const std::string& model_path,
                  float score_threshold = 0.5f,
                  float nms_threshold = 0.3f,
                  int top_k = 5000);

    std::vector<cv::Rect2f> detect(const cv::Mat& image) override;

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Size input_size_;
};

/**
 * Build the detector selected by `config.detector_backend`
 */
std::unique_ptr<FaceDetector> create_face_detector(const LocalizerConfig& config);

} // namespace anoncpp::detection
