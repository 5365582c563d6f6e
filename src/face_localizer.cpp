// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/face_localizer.hpp>
#include <anoncpp/detection/preprocess.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace anoncpp {

std::string to_string(LocalizerState state) {
    switch (state) {
        case LocalizerState::Detect: return "detect";
        case LocalizerState::Track: return "track";
        case LocalizerState::Predict: return "predict";
    }
    return "detect";
}

FaceLocalizer::FaceLocalizer(const LocalizerConfig& config)
    : FaceLocalizer(config, detection::create_face_detector(config),
                    tracking::kcf_tracker_factory())
{
}

FaceLocalizer::FaceLocalizer(const LocalizerConfig& config,
                             std::unique_ptr<detection::FaceDetector> detector,
                             tracking::TrackerFactory tracker_factory)
    : config_(config)
    , detector_(std::move(detector))
    , tracker_factory_(std::move(tracker_factory))
    , detect_interval_(config.detect_interval)
    , frame_index_(0)
    , consecutive_non_detections_(0)
    , predict_streak_(0)
    , last_state_(LocalizerState::Detect)
{
    config_.validate();
    if (!detector_) {
        throw std::invalid_argument("FaceLocalizer requires a face detector");
    }
    if (!tracker_factory_) {
        throw std::invalid_argument("FaceLocalizer requires a tracker factory");
    }
}

LocalizationResult FaceLocalizer::localize(const std::string& video_path,
                                           bool visualize,
                                           std::optional<int> detect_interval) {
    video::VideoFileSource source(video_path);
    LocalizationResult result = localize(source, visualize, detect_interval);
    result.video_path = video_path;
    return result;
}

LocalizationResult FaceLocalizer::localize(video::FrameSource& source,
                                           bool visualize,
                                           std::optional<int> detect_interval) {
    begin(source.fps(), detect_interval);

    LocalizationResult result;
    result.native_fps = source.fps();
    if (source.frame_count() > 0) {
        result.detections.reserve(static_cast<size_t>(source.frame_count()));
    }

    cv::Mat frame;
    while (source.next(frame)) {
        if (result.frame_size.empty()) {
            result.frame_size = frame.size();
        }
        DetectionRecord record = process(frame);
        if (visualize) {
            render(frame, record);
        }
        result.detections.push_back(std::move(record));
    }

    if (visualize) {
        cv::destroyAllWindows();
    }

    result.stats = finish();
    result.processed_frames = result.stats.frames_processed;
    return result;
}

void FaceLocalizer::begin(double native_fps, std::optional<int> detect_interval) {
    detect_interval_ = detect_interval.value_or(config_.detect_interval);
    if (detect_interval_ < 1) {
        throw std::invalid_argument("detect_interval must be >= 1, got " +
                                    std::to_string(detect_interval_));
    }

    frame_index_ = 0;
    consecutive_non_detections_ = 0;
    predict_streak_ = 0;
    grayscale_.reset();
    tracks_.clear();
    last_state_ = LocalizerState::Detect;

    stats_ = RunStats();
    stats_.native_fps = native_fps > 0.0 ? native_fps : 0.0;
    started_ = std::chrono::steady_clock::now();
}

LocalizerState FaceLocalizer::decide() const {
    if (frame_index_ % detect_interval_ == 0) {
        return LocalizerState::Detect;
    }
    if (consecutive_non_detections_ < config_.max_redetect_misses && tracks_.empty()) {
        return LocalizerState::Detect;
    }
    if (predict_streak_ >= config_.kalman_predict_limit) {
        return LocalizerState::Detect;
    }
    return LocalizerState::Track;
}

DetectionRecord FaceLocalizer::process(const cv::Mat& frame) {
    if (!grayscale_.has_value()) {
        grayscale_ = detection::is_grayscale(frame, config_.grayscale_tolerance);
    }

    DetectionRecord record = decide() == LocalizerState::Detect
        ? detect_step(frame)
        : track_step(frame);
    record.frame_index = frame_index_;

    if (record.boxes.empty()) {
        stats_.frames_without_faces++;
    } else {
        stats_.frames_with_faces++;
    }

    frame_index_++;
    stats_.frames_processed = frame_index_;
    return record;
}

DetectionRecord FaceLocalizer::detect_step(const cv::Mat& frame) {
    last_state_ = LocalizerState::Detect;
    stats_.detector_invocations++;

    detection::PreparedFrame prepared =
        detection::prepare_for_detection(frame, grayscale_.value_or(false), config_);
    std::vector<cv::Rect2f> faces;
    try {
        faces = detector_->detect(prepared.image);
    } catch (const std::exception& e) {
        // Counted as a missed detection
        std::cerr << "Warning: face detection failed on frame " << frame_index_
                  << ": " << e.what() << std::endl;
    }

    // Tracks are positional: every detector pass replaces the whole set
    tracks_.clear();
    predict_streak_ = 0;

    DetectionRecord record;
    record.source = DetectionSource::Detector;

    for (const auto& face : faces) {
        BoundingBox box = detection::rescale_box(face, prepared.scale_x,
                                                  prepared.scale_y, frame.size());
        if (box.w <= 0 || box.h <= 0) {
            continue;
        }
        tracks_.emplace_back(tracker_factory_(), frame, box);
        record.boxes.push_back(box);
    }

    if (record.boxes.empty()) {
        stats_.missed_detections++;
        consecutive_non_detections_++;
        record.outcome = DetectionOutcome::Failed;
    } else {
        consecutive_non_detections_ = 0;
        record.outcome = DetectionOutcome::Success;
    }
    return record;
}

DetectionRecord FaceLocalizer::track_step(const cv::Mat& frame) {
    DetectionRecord record;

    std::vector<BoundingBox> measured(tracks_.size());
    bool tracked = !tracks_.empty();
    for (size_t i = 0; i < tracks_.size() && tracked; ++i) {
        tracked = tracks_[i].track(frame, measured[i]);
    }

    if (tracked) {
        last_state_ = LocalizerState::Track;
        for (size_t i = 0; i < tracks_.size(); ++i) {
            record.boxes.push_back(tracks_[i].correct(measured[i]));
        }
        predict_streak_ = 0;
        stats_.tracker_recoveries++;
        record.source = DetectionSource::Tracker;
        record.outcome = DetectionOutcome::Success;
        return record;
    }

    if (!tracks_.empty() && consecutive_non_detections_ < config_.max_predict_misses) {
        last_state_ = LocalizerState::Predict;
        for (auto& track : tracks_) {
            record.boxes.push_back(track.predict());
        }
        predict_streak_++;
        stats_.predictor_frames++;
        record.source = DetectionSource::Kalman;
        return record;
    }

    // Nothing left to follow: report the frame as face-free rather than drift
    last_state_ = LocalizerState::Track;
    record.source = DetectionSource::Tracker;
    record.outcome = DetectionOutcome::Failed;
    return record;
}

RunStats FaceLocalizer::finish() {
    auto elapsed = std::chrono::steady_clock::now() - started_;
    stats_.elapsed_seconds = std::chrono::duration<double>(elapsed).count();

    stats_.missed_ratio = stats_.detector_invocations > 0
        ? static_cast<double>(stats_.missed_detections) / stats_.detector_invocations
        : 0.0;
    stats_.accuracy_percent = (1.0 - stats_.missed_ratio) * 100.0;
    stats_.measured_fps = stats_.elapsed_seconds > 0.0
        ? stats_.frames_processed / stats_.elapsed_seconds
        : 0.0;
    stats_.realtime_ratio = stats_.native_fps > 0.0
        ? stats_.measured_fps / stats_.native_fps
        : 0.0;

    tracks_.clear();
    return stats_;
}

void FaceLocalizer::render(const cv::Mat& frame, const DetectionRecord& record) const {
    cv::Mat canvas = frame.clone();
    if (canvas.channels() == 1) {
        cv::cvtColor(canvas, canvas, cv::COLOR_GRAY2BGR);
    }

    cv::Scalar color;
    switch (record.source) {
        case DetectionSource::Detector: color = cv::Scalar(0, 255, 0); break;
        case DetectionSource::Tracker: color = cv::Scalar(255, 128, 0); break;
        case DetectionSource::Kalman: color = cv::Scalar(0, 165, 255); break;
    }
    for (const auto& box : record.boxes) {
        cv::rectangle(canvas, box.to_rect(), color, 2);
    }

    std::string label = "frame " + std::to_string(record.frame_index) + " " +
                        to_string(record.source);
    cv::putText(canvas, label, cv::Point(10, 25), cv::FONT_HERSHEY_SIMPLEX, 0.7, color, 2);

    cv::imshow("anoncpp", canvas);
    cv::waitKey(1);
}

void print_run_stats(std::ostream& os, const RunStats& stats) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(2);
    os << "Frames processed:      " << stats.frames_processed << "\n";
    os << "Detector invocations:  " << stats.detector_invocations << "\n";
    os << "Frames with faces:     " << stats.frames_with_faces << "\n";
    os << "Frames without faces:  " << stats.frames_without_faces << "\n";
    os << "Tracker recoveries:    " << stats.tracker_recoveries << "\n";
    os << "Predictor-only frames: " << stats.predictor_frames << "\n";
    os << "Missed detections:     " << stats.missed_detections
       << " (" << stats.missed_ratio * 100.0 << "%)\n";
    os << "Detection accuracy:    " << stats.accuracy_percent << "%\n";
    os << "Throughput:            " << stats.measured_fps << " fps";
    if (stats.native_fps > 0.0) {
        os << " (" << stats.realtime_ratio << "x of " << stats.native_fps << " fps source)";
    }
    os << "\n";
    os.flags(flags);
    os.precision(precision);
}

} // namespace anoncpp
