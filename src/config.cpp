// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/config.hpp>
#include <filesystem>
#include <stdexcept>

namespace anoncpp {

void LocalizerConfig::validate() const {
    if (detect_interval < 1) {
        throw std::invalid_argument("detect_interval must be >= 1, got " +
                                    std::to_string(detect_interval));
    }
    if (kalman_predict_limit < 1) {
        throw std::invalid_argument("kalman_predict_limit must be >= 1");
    }
    if (max_detection_side < 16) {
        throw std::invalid_argument("max_detection_side must be >= 16");
    }
    if (clahe_tile < 1) {
        throw std::invalid_argument("clahe_tile must be >= 1");
    }
    if (detector_backend != "yunet" && detector_backend != "onnx") {
        throw std::invalid_argument("Unknown detector backend: " + detector_backend);
    }
}

void RedactionConfig::validate() const {
    if (kernel_size < 3 || kernel_size % 2 == 0) {
        throw std::invalid_argument("Blur kernel must be an odd number >= 3, got " +
                                    std::to_string(kernel_size));
    }
    if (!(scale_factor > 0.0)) {
        throw std::invalid_argument("scale_factor must be positive");
    }
    if (fourcc.size() != 4) {
        throw std::invalid_argument("fourcc must have 4 characters: " + fourcc);
    }
}

ParamSet param_set_from_yaml(const YAML::Node& node) {
    ParamSet params;
    if (!node || !node.IsMap()) {
        return params;
    }

    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        if (!value.IsScalar()) {
            continue;  // Nested sections are read separately
        }

        std::string text = value.as<std::string>();
        if (text == "true" || text == "True") {
            params.bool_params[key] = true;
            continue;
        }
        if (text == "false" || text == "False") {
            params.bool_params[key] = false;
            continue;
        }

        try {
            params.int_params[key] = value.as<int>();
            continue;
        } catch (const YAML::BadConversion&) {
            // Not an integer
        }
        try {
            params.float_params[key] = value.as<float>();
            continue;
        } catch (const YAML::BadConversion&) {
            // Not a number
        }
        params.string_params[key] = text;
    }

    return params;
}

ParamSet load_param_set(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }
    return param_set_from_yaml(YAML::LoadFile(config_path));
}

LocalizerConfig localizer_config_from(const ParamSet& params) {
    LocalizerConfig config;
    config.detect_interval = params.get_int("detect_interval", config.detect_interval);
    config.kalman_predict_limit = params.get_int("kalman_predict_limit", config.kalman_predict_limit);
    config.max_redetect_misses = params.get_int("max_redetect_misses", config.max_redetect_misses);
    config.max_predict_misses = params.get_int("max_predict_misses", config.max_predict_misses);
    config.max_detection_side = params.get_int("max_detection_side", config.max_detection_side);
    config.grayscale_tolerance = params.get_float("grayscale_tolerance",
                                                  static_cast<float>(config.grayscale_tolerance));
    config.clahe_clip_limit = params.get_float("clahe_clip_limit",
                                               static_cast<float>(config.clahe_clip_limit));
    config.clahe_tile = params.get_int("clahe_tile", config.clahe_tile);
    config.sharpen_amount = params.get_float("sharpen_amount",
                                             static_cast<float>(config.sharpen_amount));
    config.sharpen_sigma = params.get_float("sharpen_sigma",
                                            static_cast<float>(config.sharpen_sigma));
    config.detector_backend = params.get_string("detector_backend", config.detector_backend);
    config.detector_model = params.get_string("detector_model", config.detector_model);
    config.score_threshold = params.get_float("score_threshold", config.score_threshold);
    config.nms_threshold = params.get_float("nms_threshold", config.nms_threshold);
    config.top_k = params.get_int("top_k", config.top_k);
    config.validate();
    return config;
}

VerifierConfig verifier_config_from(const ParamSet& params) {
    VerifierConfig config;
    config.max_miss_ratio = params.get_float("max_miss_ratio",
                                             static_cast<float>(config.max_miss_ratio));
    config.max_short_gap_ratio = params.get_float("max_short_gap_ratio",
                                                  static_cast<float>(config.max_short_gap_ratio));
    config.short_gap_seconds = params.get_float("short_gap_seconds",
                                                static_cast<float>(config.short_gap_seconds));
    return config;
}

RedactionConfig redaction_config_from(const ParamSet& params) {
    RedactionConfig config;
    config.kernel_size = params.get_int("kernel_size", config.kernel_size);
    config.scale_factor = params.get_float("scale_factor",
                                           static_cast<float>(config.scale_factor));
    config.max_laplacian_variance = params.get_float("max_laplacian_variance",
                                                     static_cast<float>(config.max_laplacian_variance));
    config.fourcc = params.get_string("fourcc", config.fourcc);
    config.validate();
    return config;
}

PipelineConfig load_pipeline_config(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    YAML::Node root = YAML::LoadFile(config_path);

    PipelineConfig config;
    config.localizer = localizer_config_from(param_set_from_yaml(root["localizer"]));
    config.verifier = verifier_config_from(param_set_from_yaml(root["verifier"]));
    config.redaction = redaction_config_from(param_set_from_yaml(root["redaction"]));
    return config;
}

std::string get_default_config_path() {
    return "configs/pipeline.yaml";
}

} // namespace anoncpp
