// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/detection/face_detector.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#ifdef ANONCPP_HAS_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace anoncpp::detection {

/**
 * YuNet face detector run through ONNX Runtime
 *
 * Expects the 2023mar export with per-stride heads named
 * cls_{8,16,32}, obj_{8,16,32} and bbox_{8,16,32}. Scores are
 * sqrt(cls * obj); boxes are decoded anchor-free per grid cell and
 * filtered with cv::dnn::NMSBoxes.
 */
class ONNXFaceDetector : public FaceDetector {
public:
    /**
     * @throws std::runtime_error if the model is missing, cannot be loaded,
     *         or ONNX Runtime support was not compiled in
     */
    ONNXFaceDetector(const std::string& model_path,
                     float score_threshold = 0.5f,
                     float nms_threshold = 0.3f,
                     int top_k = 5000,
                     bool use_gpu = false);

    ~ONNXFaceDetector() override;

    std::vector<cv::Rect2f> detect(const cv::Mat& image) override;

private:
    std::string model_path_;
    float score_threshold_;
    float nms_threshold_;
    int top_k_;

#ifdef ANONCPP_HAS_ONNX
    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<Ort::Session> session_;

    std::string input_name_;
    std::vector<std::string> output_names_;

    // Fixed model input size, -1 when the dimension is dynamic
    int64_t input_height_;
    int64_t input_width_;

    std::vector<float> input_buffer_;
#endif
};

} // namespace anoncpp::detection
