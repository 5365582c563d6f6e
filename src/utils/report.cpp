// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/utils/report.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace anoncpp::utils {

namespace {

void emit_stats(YAML::Emitter& out, const RunStats& stats) {
    out << YAML::Key << "stats" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "frames_processed" << YAML::Value << stats.frames_processed;
    out << YAML::Key << "detector_invocations" << YAML::Value << stats.detector_invocations;
    out << YAML::Key << "frames_with_faces" << YAML::Value << stats.frames_with_faces;
    out << YAML::Key << "frames_without_faces" << YAML::Value << stats.frames_without_faces;
    out << YAML::Key << "tracker_recoveries" << YAML::Value << stats.tracker_recoveries;
    out << YAML::Key << "predictor_frames" << YAML::Value << stats.predictor_frames;
    out << YAML::Key << "missed_detections" << YAML::Value << stats.missed_detections;
    out << YAML::Key << "missed_ratio" << YAML::Value << stats.missed_ratio;
    out << YAML::Key << "accuracy_percent" << YAML::Value << stats.accuracy_percent;
    out << YAML::Key << "elapsed_seconds" << YAML::Value << stats.elapsed_seconds;
    out << YAML::Key << "measured_fps" << YAML::Value << stats.measured_fps;
    out << YAML::Key << "native_fps" << YAML::Value << stats.native_fps;
    out << YAML::Key << "realtime_ratio" << YAML::Value << stats.realtime_ratio;
    out << YAML::EndMap;
}

void emit_detection(YAML::Emitter& out, const VerificationVerdict& verdict) {
    const VerificationSummary& s = verdict.summary;
    out << YAML::Key << "detection" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "pass" << YAML::Value << verdict.pass;

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total_frames" << YAML::Value << s.total_frames;
    out << YAML::Key << "missing_frames" << YAML::Value << s.missing_frames;
    out << YAML::Key << "miss_ratio" << YAML::Value << s.miss_ratio;
    out << YAML::Key << "gap_count" << YAML::Value << s.gap_count;
    out << YAML::Key << "native_fps" << YAML::Value << s.native_fps;
    out << YAML::Key << "short_gap_threshold_frames" << YAML::Value << s.short_gap_threshold_frames;
    out << YAML::Key << "short_gap_ratio" << YAML::Value << s.short_gap_ratio;
    out << YAML::Key << "short_gap_count" << YAML::Value << s.short_gap_count;
    out << YAML::Key << "total_short_gap_time" << YAML::Value << s.total_short_gap_time;
    out << YAML::EndMap;

    out << YAML::Key << "gaps" << YAML::Value << YAML::BeginSeq;
    for (const auto& gap : verdict.gaps) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "starting_frame" << YAML::Value << gap.starting_frame;
        out << YAML::Key << "gap_size" << YAML::Value << gap.gap_size;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

void emit_blur(YAML::Emitter& out, const BlurVerdict& verdict) {
    out << YAML::Key << "blur" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "pass" << YAML::Value << verdict.pass;
    out << YAML::Key << "regions_measured" << YAML::Value << verdict.regions_measured;
    out << YAML::Key << "frames_measured" << YAML::Value << verdict.frames_measured;
    out << YAML::Key << "average_variance" << YAML::Value << verdict.average_variance;
    out << YAML::Key << "max_variance" << YAML::Value << verdict.max_variance;
    out << YAML::Key << "threshold" << YAML::Value << verdict.threshold;
    out << YAML::EndMap;
}

} // namespace

std::string report_to_yaml(const RunReport& report) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "video_path" << YAML::Value << report.video_path;
    if (!report.output_path.empty()) {
        out << YAML::Key << "output_path" << YAML::Value << report.output_path;
    }
    if (report.stats) {
        emit_stats(out, *report.stats);
    }
    if (report.detection) {
        emit_detection(out, *report.detection);
    }
    if (report.blur) {
        emit_blur(out, *report.blur);
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw std::runtime_error("Failed to emit report: " + out.GetLastError());
    }
    return out.c_str();
}

void write_report(const std::filesystem::path& output_path, const RunReport& report) {
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path());
    }
    std::ofstream file(output_path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write report: " + output_path.string());
    }
    file << report_to_yaml(report) << "\n";
}

} // namespace anoncpp::utils
