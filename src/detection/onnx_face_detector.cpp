// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/detection/onnx_face_detector.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#ifdef ANONCPP_HAS_ONNX

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <unordered_map>

namespace anoncpp::detection {

namespace {
constexpr std::array<int, 3> kStrides = {8, 16, 32};
constexpr int kPadMultiple = 32;
}

ONNXFaceDetector::ONNXFaceDetector(const std::string& model_path,
                                   float score_threshold,
                                   float nms_threshold,
                                   int top_k,
                                   bool use_gpu)
    : model_path_(model_path)
    , score_threshold_(score_threshold)
    , nms_threshold_(nms_threshold)
    , top_k_(top_k)
    , env_(ORT_LOGGING_LEVEL_WARNING, "anoncppFaceDetector")
    , input_height_(-1)
    , input_width_(-1)
{
    if (!std::filesystem::exists(model_path_)) {
        throw std::runtime_error("Face detector model not found: " + model_path_);
    }

    session_options_.SetIntraOpNumThreads(1);
    session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    if (use_gpu) {
        OrtCUDAProviderOptions cuda_options;
        session_options_.AppendExecutionProvider_CUDA(cuda_options);
    }

    try {
        session_ = std::make_unique<Ort::Session>(env_, model_path_.c_str(), session_options_);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load ONNX model: " + std::string(e.what()));
    }

    Ort::AllocatorWithDefaultOptions allocator;

    if (session_->GetInputCount() != 1) {
        throw std::runtime_error("Expected single input node, got " +
                                 std::to_string(session_->GetInputCount()));
    }
    input_name_ = session_->GetInputNameAllocated(0, allocator).get();

    auto input_shape = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (input_shape.size() != 4) {
        throw std::runtime_error("Expected NCHW input, got rank " +
                                 std::to_string(input_shape.size()));
    }
    input_height_ = input_shape[2];
    input_width_ = input_shape[3];

    for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
        output_names_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
    }

    for (int stride : kStrides) {
        for (const char* head : {"cls_", "obj_", "bbox_"}) {
            std::string name = head + std::to_string(stride);
            if (std::find(output_names_.begin(), output_names_.end(), name) == output_names_.end()) {
                throw std::runtime_error("Model has no output named " + name);
            }
        }
    }
}

ONNXFaceDetector::~ONNXFaceDetector() = default;

std::vector<cv::Rect2f> ONNXFaceDetector::detect(const cv::Mat& image) {
    std::vector<cv::Rect2f> result;
    if (image.empty()) {
        return result;
    }

    // Fixed-size models get a resized frame; dynamic ones a zero-padded frame
    cv::Mat input;
    float scale_x = 1.0f;
    float scale_y = 1.0f;
    if (input_height_ > 0 && input_width_ > 0) {
        cv::resize(image, input, cv::Size(static_cast<int>(input_width_),
                                          static_cast<int>(input_height_)));
        scale_x = static_cast<float>(image.cols) / static_cast<float>(input_width_);
        scale_y = static_cast<float>(image.rows) / static_cast<float>(input_height_);
    } else {
        int pad_w = ((image.cols - 1) / kPadMultiple + 1) * kPadMultiple;
        int pad_h = ((image.rows - 1) / kPadMultiple + 1) * kPadMultiple;
        cv::copyMakeBorder(image, input, 0, pad_h - image.rows, 0, pad_w - image.cols,
                           cv::BORDER_CONSTANT, cv::Scalar::all(0));
    }

    // BGR, unnormalized, NCHW
    cv::Mat blob = cv::dnn::blobFromImage(input);
    const int height = input.rows;
    const int width = input.cols;
    input_buffer_.assign(blob.ptr<float>(), blob.ptr<float>() + blob.total());

    std::array<int64_t, 4> input_dims = {1, 3, height, width};
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info, input_buffer_.data(), input_buffer_.size(),
        input_dims.data(), input_dims.size());

    std::vector<const char*> output_names;
    output_names.reserve(output_names_.size());
    for (const auto& name : output_names_) {
        output_names.push_back(name.c_str());
    }
    const char* input_names[] = {input_name_.c_str()};

    std::vector<Ort::Value> outputs;
    try {
        outputs = session_->Run(Ort::RunOptions{nullptr},
                                input_names, &input_tensor, 1,
                                output_names.data(), output_names.size());
    } catch (const Ort::Exception& e) {
        std::cerr << "Warning: ONNX Runtime inference failed: " << e.what() << std::endl;
        return result;
    }

    std::unordered_map<std::string, const float*> heads;
    for (size_t i = 0; i < outputs.size(); ++i) {
        heads[output_names_[i]] = outputs[i].GetTensorData<float>();
    }

    std::vector<cv::Rect2d> boxes;
    std::vector<float> scores;
    for (int stride : kStrides) {
        const float* cls = heads.at("cls_" + std::to_string(stride));
        const float* obj = heads.at("obj_" + std::to_string(stride));
        const float* bbox = heads.at("bbox_" + std::to_string(stride));

        const int cols = width / stride;
        const int rows = height / stride;
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                const int idx = r * cols + c;
                float cls_score = std::clamp(cls[idx], 0.0f, 1.0f);
                float obj_score = std::clamp(obj[idx], 0.0f, 1.0f);
                float score = std::sqrt(cls_score * obj_score);
                if (score < score_threshold_) {
                    continue;
                }

                float cx = (c + bbox[idx * 4 + 0]) * stride;
                float cy = (r + bbox[idx * 4 + 1]) * stride;
                float w = std::exp(bbox[idx * 4 + 2]) * stride;
                float h = std::exp(bbox[idx * 4 + 3]) * stride;

                boxes.emplace_back((cx - w / 2.0f) * scale_x, (cy - h / 2.0f) * scale_y,
                                   w * scale_x, h * scale_y);
                scores.push_back(score);
            }
        }
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, score_threshold_, nms_threshold_, keep, 1.0f, top_k_);

    result.reserve(keep.size());
    for (int idx : keep) {
        const auto& b = boxes[idx];
        result.emplace_back(static_cast<float>(b.x), static_cast<float>(b.y),
                            static_cast<float>(b.width), static_cast<float>(b.height));
    }
    return result;
}

} // namespace anoncpp::detection

#else  // ANONCPP_HAS_ONNX not defined

namespace anoncpp::detection {

ONNXFaceDetector::ONNXFaceDetector(const std::string& model_path,
                                   float score_threshold,
                                   float nms_threshold,
                                   int top_k,
                                   bool /* use_gpu */)
    : model_path_(model_path)
    , score_threshold_(score_threshold)
    , nms_threshold_(nms_threshold)
    , top_k_(top_k)
{
    throw std::runtime_error("ONNX Runtime not available. "
                             "Compile with ANONCPP_HAS_ONNX or use the yunet backend.");
}

ONNXFaceDetector::~ONNXFaceDetector() = default;

std::vector<cv::Rect2f> ONNXFaceDetector::detect(const cv::Mat& /* image */) {
    throw std::runtime_error("ONNX Runtime not available.");
}

} // namespace anoncpp::detection

#endif  // ANONCPP_HAS_ONNX
