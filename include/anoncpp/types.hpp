// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anoncpp {

/**
 * Axis-aligned face box in pixel coordinates of the original, unscaled frame.
 * (x, y) is the top-left corner.
 */
struct BoundingBox {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    cv::Rect to_rect() const { return cv::Rect(x, y, w, h); }
    static BoundingBox from_rect(const cv::Rect& r) { return {r.x, r.y, r.width, r.height}; }

    bool operator==(const BoundingBox& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

/**
 * Which stage produced the boxes of a frame
 */
enum class DetectionSource {
    Detector = 0,
    Tracker = 1,
    Kalman = 2
};

enum class DetectionOutcome {
    Success = 0,
    Failed = 1
};

std::string to_string(DetectionSource source);
std::string to_string(DetectionOutcome outcome);
DetectionSource parse_detection_source(const std::string& text);
DetectionOutcome parse_detection_outcome(const std::string& text);

/**
 * One record per processed frame. Records are appended in frame order and
 * never modified afterwards.
 */
struct DetectionRecord {
    int frame_index = 0;
    std::vector<BoundingBox> boxes;
    DetectionSource source = DetectionSource::Detector;
    std::optional<DetectionOutcome> outcome;

    bool operator==(const DetectionRecord& other) const {
        return frame_index == other.frame_index && boxes == other.boxes &&
               source == other.source && outcome == other.outcome;
    }
};

/**
 * Aggregate counters of one localization run
 */
struct RunStats {
    int frames_processed = 0;
    int detector_invocations = 0;
    int frames_with_faces = 0;
    int frames_without_faces = 0;
    int tracker_recoveries = 0;
    int predictor_frames = 0;
    int missed_detections = 0;
    double missed_ratio = 0.0;
    double accuracy_percent = 0.0;
    double elapsed_seconds = 0.0;
    double measured_fps = 0.0;
    double native_fps = 0.0;
    double realtime_ratio = 0.0;
};

/**
 * Output of FaceLocalizer::localize, consumed by the redaction stage
 */
struct LocalizationResult {
    std::string video_path;
    int processed_frames = 0;
    double native_fps = 0.0;
    cv::Size frame_size;
    std::vector<DetectionRecord> detections;
    RunStats stats;
};

struct GapRecord {
    int starting_frame = 0;
    int gap_size = 0;

    bool operator==(const GapRecord& other) const {
        return starting_frame == other.starting_frame && gap_size == other.gap_size;
    }
};

struct VerificationSummary {
    int total_frames = 0;
    int missing_frames = 0;
    double miss_ratio = 0.0;
    int gap_count = 0;
    double native_fps = 0.0;
    double short_gap_threshold_frames = 0.0;
    double short_gap_ratio = 0.0;
    int short_gap_count = 0;
    int total_short_gap_time = 0;

    bool operator==(const VerificationSummary& other) const {
        return total_frames == other.total_frames &&
               missing_frames == other.missing_frames &&
               miss_ratio == other.miss_ratio &&
               gap_count == other.gap_count &&
               native_fps == other.native_fps &&
               short_gap_threshold_frames == other.short_gap_threshold_frames &&
               short_gap_ratio == other.short_gap_ratio &&
               short_gap_count == other.short_gap_count &&
               total_short_gap_time == other.total_short_gap_time;
    }
};

struct VerificationVerdict {
    std::vector<GapRecord> gaps;
    VerificationSummary summary;
    bool pass = true;

    bool operator==(const VerificationVerdict& other) const {
        return gaps == other.gaps && summary == other.summary && pass == other.pass;
    }
};

/**
 * Residual sharpness measured inside blurred regions
 */
struct BlurVerdict {
    int regions_measured = 0;
    int frames_measured = 0;
    double average_variance = 0.0;
    double max_variance = 0.0;
    double threshold = 0.0;
    bool pass = true;
};

} // namespace anoncpp
