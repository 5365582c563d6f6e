// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace anoncpp {

/**
 * Flat, typed parameter bag read from a YAML mapping
 */
struct ParamSet {
    std::unordered_map<std::string, float> float_params;
    std::unordered_map<std::string, int> int_params;
    std::unordered_map<std::string, bool> bool_params;
    std::unordered_map<std::string, std::string> string_params;

    // Integer-valued entries are accepted where a float is asked for
    float get_float(const std::string& key, float default_value) const {
        auto it = float_params.find(key);
        if (it != float_params.end()) {
            return it->second;
        }
        auto int_it = int_params.find(key);
        return (int_it != int_params.end()) ? static_cast<float>(int_it->second) : default_value;
    }

    int get_int(const std::string& key, int default_value) const {
        auto it = int_params.find(key);
        return (it != int_params.end()) ? it->second : default_value;
    }

    bool get_bool(const std::string& key, bool default_value) const {
        auto it = bool_params.find(key);
        return (it != bool_params.end()) ? it->second : default_value;
    }

    std::string get_string(const std::string& key, const std::string& default_value) const {
        auto it = string_params.find(key);
        return (it != string_params.end()) ? it->second : default_value;
    }

    bool contains(const std::string& key) const {
        return float_params.count(key) || int_params.count(key) ||
               bool_params.count(key) || string_params.count(key);
    }

    void set(const std::string& key, float value) { float_params[key] = value; }
    void set(const std::string& key, int value) { int_params[key] = value; }
    void set(const std::string& key, bool value) { bool_params[key] = value; }
    void set(const std::string& key, const std::string& value) { string_params[key] = value; }
    void set(const std::string& key, const char* value) { string_params[key] = value; }
};

/**
 * Face localizer parameters
 */
struct LocalizerConfig {
    int detect_interval = 3;
    int kalman_predict_limit = 6;
    // Re-run the detector on the next frame while fewer misses than this
    int max_redetect_misses = 2;
    // Fall back to prediction while fewer misses than this
    int max_predict_misses = 3;

    // Preprocessing
    int max_detection_side = 780;
    double grayscale_tolerance = 1.0;
    double clahe_clip_limit = 4.0;
    int clahe_tile = 6;
    double sharpen_amount = 0.8;
    double sharpen_sigma = 3.0;

    // Detector
    std::string detector_backend = "yunet";
    std::string detector_model = "models/face_detection_yunet_2023mar.onnx";
    float score_threshold = 0.5f;
    float nms_threshold = 0.3f;
    int top_k = 5000;

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * Detection sequence quality thresholds
 */
struct VerifierConfig {
    double max_miss_ratio = 0.1;
    double max_short_gap_ratio = 0.1;
    double short_gap_seconds = 0.5;
};

/**
 * Blur redaction and blur verification parameters
 */
struct RedactionConfig {
    int kernel_size = 31;
    double scale_factor = 2.0;
    double max_laplacian_variance = 50.0;
    std::string fourcc = "mp4v";

    void validate() const;
};

struct PipelineConfig {
    LocalizerConfig localizer;
    VerifierConfig verifier;
    RedactionConfig redaction;
};

/**
 * Parse the scalar entries of a YAML mapping
 */
ParamSet param_set_from_yaml(const YAML::Node& node);

/**
 * Load a flat YAML file into a ParamSet
 * @throws std::runtime_error if the file does not exist
 */
ParamSet load_param_set(const std::string& config_path);

LocalizerConfig localizer_config_from(const ParamSet& params);
VerifierConfig verifier_config_from(const ParamSet& params);
RedactionConfig redaction_config_from(const ParamSet& params);

/**
 * Load a pipeline file with optional `localizer`, `verifier` and `redaction`
 * sections. Missing keys keep their defaults.
 * @throws std::runtime_error if the file does not exist
 */
PipelineConfig load_pipeline_config(const std::string& config_path);

/**
 * Default pipeline config path relative to the project root
 */
std::string get_default_config_path();

} // namespace anoncpp
