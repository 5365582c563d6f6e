// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/pipeline/builtin_tools.hpp>
#include <anoncpp/detection_verifier.hpp>
#include <anoncpp/redaction/blur_redactor.hpp>
#include <anoncpp/redaction/blur_verifier.hpp>
#include <anoncpp/utils/detection_format.hpp>
#include <optional>
#include <stdexcept>
#include <utility>

namespace anoncpp::pipeline {

namespace {

void merge_into(ParamSet& target, const ParamSet& source) {
    for (const auto& [key, value] : source.float_params) target.float_params[key] = value;
    for (const auto& [key, value] : source.int_params) target.int_params[key] = value;
    for (const auto& [key, value] : source.bool_params) target.bool_params[key] = value;
    for (const auto& [key, value] : source.string_params) target.string_params[key] = value;
}

} // namespace

// ---------------------------------------------------------------------------
// detect_faces
// ---------------------------------------------------------------------------

DetectFacesTool::DetectFacesTool(const PipelineConfig& config, LocalizerFactory localizer_factory)
    : config_(config)
    , localizer_factory_(std::move(localizer_factory))
{
    if (!localizer_factory_) {
        LocalizerConfig localizer_config = config_.localizer;
        localizer_factory_ = [localizer_config]() {
            return std::make_unique<FaceLocalizer>(localizer_config);
        };
    }
}

ToolResult DetectFacesTool::apply(const ToolArgs& args) {
    std::string video_path = require_string(args, "video_path");
    std::string detections_path = require_string(args, "detections_path");

    std::optional<int> interval;
    if (args.int_params.count("detect_interval")) {
        interval = args.get_int("detect_interval", config_.localizer.detect_interval);
    }

    if (!localizer_) {
        localizer_ = localizer_factory_();
        if (!localizer_) {
            throw std::runtime_error("Localizer factory returned null");
        }
    }

    LocalizationResult result =
        localizer_->localize(video_path, args.get_bool("visualize", false), interval);
    utils::write_detections(detections_path, result.detections);

    ToolResult out;
    out.ok = true;
    out.outputs.set("detections_path", detections_path);
    out.outputs.set("processed_frames", result.processed_frames);
    out.outputs.set("native_fps", static_cast<float>(result.native_fps));
    out.outputs.set("missed_ratio", static_cast<float>(result.stats.missed_ratio));
    out.message = "Localized faces in " + std::to_string(result.processed_frames) + " frames";
    return out;
}

ToolResult DetectFacesTool::verify(const ToolArgs& args) {
    std::string detections_path = require_string(args, "detections_path");
    // 0 when the container reports no frame rate; no gap then counts as short
    float fps = args.get_float("native_fps", 0.0f);

    std::vector<DetectionRecord> detections = utils::read_detections(detections_path);
    DetectionVerifier verifier(config_.verifier);
    VerificationVerdict verdict = verifier.verify(detections, fps);

    ToolResult out;
    out.ok = verdict.pass;
    out.outputs.set("pass", verdict.pass);
    out.outputs.set("missing_frames", verdict.summary.missing_frames);
    out.outputs.set("miss_ratio", static_cast<float>(verdict.summary.miss_ratio));
    out.outputs.set("short_gap_ratio", static_cast<float>(verdict.summary.short_gap_ratio));
    out.outputs.set("gap_count", verdict.summary.gap_count);
    out.message = verdict.pass ? "Detection sequence passed"
                               : "Detection sequence failed verification";
    return out;
}

// ---------------------------------------------------------------------------
// blur
// ---------------------------------------------------------------------------

BlurTool::BlurTool(const RedactionConfig& config)
    : config_(config)
{
    config_.validate();
}

RedactionConfig BlurTool::config_for(const ToolArgs& args) const {
    RedactionConfig config = config_;
    config.kernel_size = args.get_int("kernel_size", config.kernel_size);
    config.scale_factor = args.get_float("scale_factor", static_cast<float>(config.scale_factor));
    config.validate();
    return config;
}

ToolResult BlurTool::apply(const ToolArgs& args) {
    LocalizationResult result;
    result.video_path = require_string(args, "video_path");
    result.detections = utils::read_detections(require_string(args, "detections_path"));
    result.native_fps = args.get_float("native_fps", 0.0f);
    std::string output_path = require_string(args, "output_path");

    redaction::BlurRedactor redactor(config_for(args));
    int written = redactor.redact_video(result, output_path);

    ToolResult out;
    out.ok = written > 0;
    out.outputs.set("output_path", output_path);
    out.outputs.set("frames_written", written);
    out.message = out.ok ? "Wrote " + std::to_string(written) + " frames to " + output_path
                         : "No frames read from " + result.video_path;
    return out;
}

ToolResult BlurTool::verify(const ToolArgs& args) {
    std::string output_path = require_string(args, "output_path");
    redaction::BlurVerifier verifier(config_for(args));
    std::vector<DetectionRecord> detections =
        utils::read_detections(require_string(args, "detections_path"));

    BlurVerdict verdict = verifier.verify(output_path, detections);

    ToolResult out;
    out.ok = verdict.pass;
    out.outputs.set("pass", verdict.pass);
    out.outputs.set("regions_measured", verdict.regions_measured);
    out.outputs.set("average_variance", static_cast<float>(verdict.average_variance));
    out.outputs.set("max_variance", static_cast<float>(verdict.max_variance));
    out.message = verdict.pass ? "Face regions are blurred"
                               : "Face regions are still sharp";
    return out;
}

// ---------------------------------------------------------------------------
// blur_faces
// ---------------------------------------------------------------------------

BlurFacesTool::BlurFacesTool(PrivacyTool& detect, PrivacyTool& blur)
    : detect_(detect)
    , blur_(blur)
{
}

ToolResult BlurFacesTool::apply(const ToolArgs& args) {
    ToolResult result;

    ToolResult detected = detect_.apply(args);
    merge_into(result.outputs, detected.outputs);
    if (!detected.ok) {
        result.message = detected.message;
        return result;
    }

    ToolArgs next = args;
    merge_into(next, detected.outputs);

    ToolResult checked = detect_.verify(next);
    merge_into(result.outputs, checked.outputs);
    result.outputs.set("detection_pass", checked.ok);
    if (!checked.ok) {
        result.message = checked.message + "; redaction skipped";
        return result;
    }

    ToolResult blurred = blur_.apply(next);
    merge_into(result.outputs, blurred.outputs);
    if (!blurred.ok) {
        result.message = blurred.message;
        return result;
    }

    ToolResult blur_checked = blur_.verify(next);
    merge_into(result.outputs, blur_checked.outputs);
    result.outputs.set("blur_pass", blur_checked.ok);
    result.ok = blur_checked.ok;
    result.message = blur_checked.message;
    return result;
}

ToolResult BlurFacesTool::verify(const ToolArgs& args) {
    return blur_.verify(args);
}

std::unique_ptr<ToolRegistry> make_default_registry(const PipelineConfig& config,
                                                    LocalizerFactory localizer_factory) {
    auto registry = std::make_unique<ToolRegistry>();
    PrivacyTool& detect = registry->add(
        std::make_unique<DetectFacesTool>(config, std::move(localizer_factory)));
    PrivacyTool& blur = registry->add(std::make_unique<BlurTool>(config.redaction));
    registry->add(std::make_unique<BlurFacesTool>(detect, blur));
    return registry;
}

} // namespace anoncpp::pipeline
