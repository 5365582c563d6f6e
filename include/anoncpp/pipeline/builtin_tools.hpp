// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/face_localizer.hpp>
#include <anoncpp/pipeline/privacy_tool.hpp>
#include <anoncpp/pipeline/tool_registry.hpp>
#include <functional>
#include <memory>
#include <string>

namespace anoncpp::pipeline {

using LocalizerFactory = std::function<std::unique_ptr<FaceLocalizer>()>;

/**
 * detect_faces
 *
 * apply:  video_path, detections_path, [detect_interval], [visualize]
 *         -> detections_path, processed_frames, native_fps
 * verify: detections_path, [native_fps]
 *         -> pass, missing_frames, miss_ratio, short_gap_ratio, gap_count
 */
class DetectFacesTool : public PrivacyTool {
public:
    // The localizer is built on first use, so registering the tool never loads a model
    explicit DetectFacesTool(const PipelineConfig& config,
                             LocalizerFactory localizer_factory = nullptr);

    std::string name() const override { return "detect_faces"; }
    ToolResult apply(const ToolArgs& args) override;
    ToolResult verify(const ToolArgs& args) override;

private:
    PipelineConfig config_;
    LocalizerFactory localizer_factory_;
    std::unique_ptr<FaceLocalizer> localizer_;
};

/**
 * blur
 *
 * apply:  video_path, detections_path, output_path, [native_fps],
 *         [kernel_size], [scale_factor] -> output_path, frames_written
 * verify: output_path, detections_path
 *         -> pass, regions_measured, average_variance, max_variance
 */
class BlurTool : public PrivacyTool {
public:
    explicit BlurTool(const RedactionConfig& config = RedactionConfig());

    std::string name() const override { return "blur"; }
    ToolResult apply(const ToolArgs& args) override;
    ToolResult verify(const ToolArgs& args) override;

private:
    RedactionConfig config_;

    RedactionConfig config_for(const ToolArgs& args) const;
};

/**
 * blur_faces: detect_faces then blur, stopping before redaction when the
 * detection sequence fails verification.
 */
class BlurFacesTool : public PrivacyTool {
public:
    BlurFacesTool(PrivacyTool& detect, PrivacyTool& blur);

    std::string name() const override { return "blur_faces"; }
    ToolResult apply(const ToolArgs& args) override;
    ToolResult verify(const ToolArgs& args) override;

private:
    PrivacyTool& detect_;
    PrivacyTool& blur_;
};

/**
 * Registry holding detect_faces, blur and blur_faces
 */
std::unique_ptr<ToolRegistry> make_default_registry(const PipelineConfig& config,
                                                    LocalizerFactory localizer_factory = nullptr);

} // namespace anoncpp::pipeline
