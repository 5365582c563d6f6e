// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/detection/face_detector.hpp>
#include <anoncpp/tracking/track_state.hpp>
#include <anoncpp/tracking/visual_tracker.hpp>
#include <anoncpp/types.hpp>
#include <anoncpp/video/frame_source.hpp>
#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace anoncpp {

/**
 * Per-frame decision of the localizer
 */
enum class LocalizerState {
    Detect = 0,
    Track = 1,
    Predict = 2
};

std::string to_string(LocalizerState state);

/**
 * Hybrid face localizer
 *
 * Each frame is resolved by one of three stages:
 * - Detect: run the face detector, replace all tracks with fresh ones
 * - Track: follow every track with its visual tracker and correct its filter
 * - Predict: project every track forward with its filter alone
 *
 * The detector runs every `detect_interval` frames, on the frame after a miss
 * (until `max_redetect_misses` consecutive misses), and after
 * `kalman_predict_limit` consecutive predicted frames. Once
 * `max_predict_misses` consecutive detector passes found nothing, frames the
 * tracker cannot resolve are reported empty instead of predicted.
 *
 * Per-frame misses are never errors: they show up as empty boxes.
 */
class FaceLocalizer {
public:
    /**
     * Build with the detector selected by `config` and KCF trackers
     * @throws std::runtime_error if the detector model cannot be loaded
     * @throws std::invalid_argument on invalid parameters
     */
    explicit FaceLocalizer(const LocalizerConfig& config = LocalizerConfig());

    FaceLocalizer(const LocalizerConfig& config,
                  std::unique_ptr<detection::FaceDetector> detector,
                  tracking::TrackerFactory tracker_factory);

    /**
     * Localize faces in every frame of a video file
     * @param video_path Video to read
     * @param visualize Show frames with boxes while processing (debug aid)
     * @param detect_interval Overrides the configured interval for this run
     * @throws std::runtime_error if the video cannot be opened
     */
    LocalizationResult localize(const std::string& video_path,
                                bool visualize = false,
                                std::optional<int> detect_interval = std::nullopt);

    /**
     * Localize faces in every frame of an open stream
     */
    LocalizationResult localize(video::FrameSource& source,
                                bool visualize = false,
                                std::optional<int> detect_interval = std::nullopt);

    /**
     * Start a streaming session; discards the state of any previous session
     */
    void begin(double native_fps, std::optional<int> detect_interval = std::nullopt);

    /**
     * Resolve the next frame of the current session
     */
    DetectionRecord process(const cv::Mat& frame);

    /**
     * Close the session and compute its statistics
     */
    RunStats finish();

    LocalizerState last_state() const { return last_state_; }
    int frames_processed() const { return frame_index_; }
    int predict_streak() const { return predict_streak_; }
    int consecutive_non_detections() const { return consecutive_non_detections_; }
    size_t active_tracks() const { return tracks_.size(); }
    bool grayscale_source() const { return grayscale_.value_or(false); }
    const LocalizerConfig& config() const { return config_; }

private:
    LocalizerConfig config_;
    std::unique_ptr<detection::FaceDetector> detector_;
    tracking::TrackerFactory tracker_factory_;

    // Session state
    int detect_interval_;
    int frame_index_;
    int consecutive_non_detections_;
    int predict_streak_;
    std::optional<bool> grayscale_;
    std::vector<tracking::TrackState> tracks_;
    LocalizerState last_state_;

    // Session counters
    RunStats stats_;
    std::chrono::steady_clock::time_point started_;

    LocalizerState decide() const;
    DetectionRecord detect_step(const cv::Mat& frame);
    DetectionRecord track_step(const cv::Mat& frame);
    void render(const cv::Mat& frame, const DetectionRecord& record) const;
};

/**
 * Human-readable run report
 */
void print_run_stats(std::ostream& os, const RunStats& stats);

} // namespace anoncpp
