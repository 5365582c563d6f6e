// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 anoncpp contributors

#include <gtest/gtest.h>
#include <anoncpp/face_localizer.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace anoncpp::test {

namespace {

// Detector whose answer is chosen per call
struct DetectorScript {
    std::vector<std::vector<cv::Rect2f>> answers;  // by call; last entry repeats
    int calls = 0;
    int fail_on_call = -1;
    cv::Size last_input;
};

class ScriptedDetector : public detection::FaceDetector {
public:
    explicit ScriptedDetector(std::shared_ptr<DetectorScript> script) : script_(std::move(script)) {}

    std::vector<cv::Rect2f> detect(const cv::Mat& image) override {
        script_->last_input = image.size();
        int call = script_->calls++;
        if (call == script_->fail_on_call) {
            throw std::runtime_error("inference failed");
        }
        if (script_->answers.empty()) {
            return {};
        }
        size_t i = std::min(static_cast<size_t>(call), script_->answers.size() - 1);
        return script_->answers[i];
    }

private:
    std::shared_ptr<DetectorScript> script_;
};

struct TrackerScript {
    bool succeed = true;
    int dx = 0;  // per-update drift of the reported box
    int created = 0;
    int updates = 0;
};

class ScriptedTracker : public tracking::VisualTracker {
public:
    explicit ScriptedTracker(std::shared_ptr<TrackerScript> script) : script_(std::move(script)) {}

    bool init(const cv::Mat&, const BoundingBox& box) override {
        box_ = box;
        return true;
    }

    bool update(const cv::Mat&, BoundingBox& box) override {
        script_->updates++;
        if (!script_->succeed) {
            return false;
        }
        box_.x += script_->dx;
        box = box_;
        return true;
    }

private:
    std::shared_ptr<TrackerScript> script_;
    BoundingBox box_;
};

std::vector<cv::Mat> color_frames(int n, cv::Size size = cv::Size(320, 240)) {
    std::vector<cv::Mat> frames;
    for (int i = 0; i < n; ++i) {
        frames.emplace_back(size, CV_8UC3, cv::Scalar(30, 90, 160));
    }
    return frames;
}

const cv::Rect2f kFace(100.0f, 60.0f, 40.0f, 50.0f);

} // namespace

class FaceLocalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector_script_ = std::make_shared<DetectorScript>();
        tracker_script_ = std::make_shared<TrackerScript>();
    }

    std::unique_ptr<FaceLocalizer> make_localizer(const LocalizerConfig& config = LocalizerConfig()) {
        auto tracker_script = tracker_script_;
        return std::make_unique<FaceLocalizer>(
            config,
            std::make_unique<ScriptedDetector>(detector_script_),
            [tracker_script]() {
                tracker_script->created++;
                return std::make_unique<ScriptedTracker>(tracker_script);
            });
    }

    LocalizationResult run(FaceLocalizer& localizer, int frames,
                           std::optional<int> interval = std::nullopt) {
        video::MemoryFrameSource source(color_frames(frames), 30.0);
        return localizer.localize(source, false, interval);
    }

    std::shared_ptr<DetectorScript> detector_script_;
    std::shared_ptr<TrackerScript> tracker_script_;
};

TEST_F(FaceLocalizerTest, OneRecordPerFrameInOrder) {
    detector_script_->answers = {{kFace}};
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 12);

    ASSERT_EQ(result.detections.size(), 12u);
    for (size_t i = 0; i < result.detections.size(); ++i) {
        EXPECT_EQ(result.detections[i].frame_index, static_cast<int>(i));
    }
    EXPECT_EQ(result.processed_frames, 12);
    EXPECT_DOUBLE_EQ(result.native_fps, 30.0);
    EXPECT_EQ(result.frame_size, cv::Size(320, 240));
}

TEST_F(FaceLocalizerTest, DetectsOnIntervalAndTracksBetween) {
    detector_script_->answers = {{kFace}};
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 9);

    const DetectionSource D = DetectionSource::Detector;
    const DetectionSource T = DetectionSource::Tracker;
    std::vector<DetectionSource> expected = {D, T, T, D, T, T, D, T, T};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(result.detections[i].source, expected[i]) << "frame " << i;
        EXPECT_EQ(result.detections[i].outcome, DetectionOutcome::Success);
        EXPECT_EQ(result.detections[i].boxes.size(), 1u);
    }

    EXPECT_EQ(result.stats.detector_invocations, 3);
    EXPECT_EQ(result.stats.tracker_recoveries, 6);
    EXPECT_EQ(result.stats.frames_with_faces, 9);
    EXPECT_EQ(result.stats.frames_without_faces, 0);
    EXPECT_DOUBLE_EQ(result.stats.missed_ratio, 0.0);
    EXPECT_DOUBLE_EQ(result.stats.accuracy_percent, 100.0);
    EXPECT_EQ(tracker_script_->created, 3);
}

TEST_F(FaceLocalizerTest, IntervalOneRunsDetectorEveryFrame) {
    detector_script_->answers = {{kFace}};
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 7, 1);

    for (const auto& record : result.detections) {
        EXPECT_EQ(record.source, DetectionSource::Detector);
    }
    EXPECT_EQ(detector_script_->calls, 7);
    EXPECT_EQ(tracker_script_->updates, 0);
}

TEST_F(FaceLocalizerTest, DetectedBoxIsTheDetectorBox) {
    detector_script_->answers = {{kFace}};
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 1);

    ASSERT_EQ(result.detections[0].boxes.size(), 1u);
    EXPECT_EQ(result.detections[0].boxes[0], (BoundingBox{100, 60, 40, 50}));
}

TEST_F(FaceLocalizerTest, LargeFramesAreDownscaledAndBoxesMappedBack) {
    detector_script_->answers = {{cv::Rect2f(100.0f, 100.0f, 50.0f, 50.0f)}};
    auto localizer = make_localizer();
    video::MemoryFrameSource source(color_frames(1, cv::Size(1560, 1170)), 25.0);
    LocalizationResult result = localizer->localize(source);

    EXPECT_EQ(detector_script_->last_input.width, 780);
    ASSERT_EQ(result.detections[0].boxes.size(), 1u);
    const BoundingBox& box = result.detections[0].boxes[0];
    EXPECT_NEAR(box.x, 200, 1);
    EXPECT_NEAR(box.y, 200, 1);
    EXPECT_NEAR(box.w, 100, 1);
    EXPECT_NEAR(box.h, 100, 1);
}

TEST_F(FaceLocalizerTest, TrackerBoxesAreFiltered) {
    detector_script_->answers = {{kFace}};
    tracker_script_->dx = 3;
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 3);

    // Filtered estimate lies between the previous estimate and the tracker
    ASSERT_EQ(result.detections[1].boxes.size(), 1u);
    int x = result.detections[1].boxes[0].x;
    EXPECT_GE(x, 100);
    EXPECT_LE(x, 103);
}

TEST_F(FaceLocalizerTest, PredictsUntilLimitThenRedetects) {
    detector_script_->answers = {{kFace}};
    tracker_script_->succeed = false;
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 14, 100);

    for (int i : {0, 7}) {
        EXPECT_EQ(result.detections[i].source, DetectionSource::Detector) << "frame " << i;
    }
    for (int i : {1, 2, 3, 4, 5, 6, 8, 13}) {
        const DetectionRecord& record = result.detections[i];
        EXPECT_EQ(record.source, DetectionSource::Kalman) << "frame " << i;
        EXPECT_FALSE(record.outcome.has_value());
        EXPECT_EQ(record.boxes.size(), 1u);
    }

    EXPECT_EQ(result.stats.detector_invocations, 2);
    EXPECT_EQ(result.stats.predictor_frames, 12);
    EXPECT_EQ(result.stats.tracker_recoveries, 0);
}

TEST_F(FaceLocalizerTest, PredictStreakNeverExceedsLimit) {
    detector_script_->answers = {{kFace}};
    tracker_script_->succeed = false;
    LocalizerConfig config;
    config.kalman_predict_limit = 4;
    auto localizer = make_localizer(config);

    localizer->begin(30.0, 50);
    for (const auto& frame : color_frames(40)) {
        localizer->process(frame);
        EXPECT_LE(localizer->predict_streak(), 4);
    }
    RunStats stats = localizer->finish();
    EXPECT_EQ(stats.frames_processed, 40);
    EXPECT_EQ(stats.detector_invocations, 8);
}

TEST_F(FaceLocalizerTest, DetectorErrorOnOneFrameIsAMiss) {
    detector_script_->answers = {{kFace}};
    detector_script_->fail_on_call = 1;
    auto localizer = make_localizer();

    LocalizationResult result;
    ASSERT_NO_THROW(result = run(*localizer, 9));
    ASSERT_EQ(result.detections.size(), 9u);

    const DetectionRecord& failed = result.detections[3];
    EXPECT_EQ(failed.source, DetectionSource::Detector);
    EXPECT_EQ(failed.outcome, DetectionOutcome::Failed);
    EXPECT_TRUE(failed.boxes.empty());

    // The next frame retries the detector and recovers
    EXPECT_EQ(result.detections[4].source, DetectionSource::Detector);
    EXPECT_EQ(result.detections[4].outcome, DetectionOutcome::Success);

    EXPECT_EQ(result.stats.frames_processed, 9);
    EXPECT_EQ(result.stats.missed_detections, 1);
    EXPECT_EQ(detector_script_->calls, 4);
}

TEST_F(FaceLocalizerTest, RedetectsAfterMissThenGivesUp) {
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 6, 100);

    EXPECT_EQ(result.detections[0].source, DetectionSource::Detector);
    EXPECT_EQ(result.detections[1].source, DetectionSource::Detector);
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(result.detections[i].outcome, DetectionOutcome::Failed);
    }
    for (int i = 2; i < 6; ++i) {
        const DetectionRecord& record = result.detections[i];
        EXPECT_EQ(record.source, DetectionSource::Tracker) << "frame " << i;
        EXPECT_EQ(record.outcome, DetectionOutcome::Failed);
        EXPECT_TRUE(record.boxes.empty());
    }

    EXPECT_EQ(result.stats.detector_invocations, 2);
    EXPECT_EQ(result.stats.missed_detections, 2);
    EXPECT_DOUBLE_EQ(result.stats.missed_ratio, 1.0);
    EXPECT_DOUBLE_EQ(result.stats.accuracy_percent, 0.0);
    EXPECT_EQ(result.stats.frames_without_faces, 6);
}

TEST_F(FaceLocalizerTest, SuccessfulDetectionClearsMissCount) {
    detector_script_->answers = {{}, {kFace}};
    auto localizer = make_localizer();

    localizer->begin(30.0, 100);
    std::vector<cv::Mat> frames = color_frames(3);
    DetectionRecord first = localizer->process(frames[0]);
    EXPECT_EQ(first.outcome, DetectionOutcome::Failed);
    EXPECT_EQ(localizer->consecutive_non_detections(), 1);

    DetectionRecord second = localizer->process(frames[1]);
    EXPECT_EQ(second.source, DetectionSource::Detector);
    EXPECT_EQ(second.outcome, DetectionOutcome::Success);
    EXPECT_EQ(localizer->consecutive_non_detections(), 0);
    EXPECT_EQ(localizer->active_tracks(), 1u);

    localizer->process(frames[2]);
    EXPECT_EQ(localizer->last_state(), LocalizerState::Track);

    RunStats stats = localizer->finish();
    EXPECT_DOUBLE_EQ(stats.missed_ratio, 0.5);
    EXPECT_DOUBLE_EQ(stats.accuracy_percent, 50.0);
}

TEST_F(FaceLocalizerTest, DetectorPassReplacesTracks) {
    detector_script_->answers = {{kFace, cv::Rect2f(10, 10, 30, 30)}, {kFace}};
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 4);

    EXPECT_EQ(result.detections[0].boxes.size(), 2u);
    EXPECT_EQ(result.detections[2].boxes.size(), 2u);
    EXPECT_EQ(result.detections[3].boxes.size(), 1u);
    EXPECT_EQ(localizer->active_tracks(), 0u);  // cleared by finish()
}

TEST_F(FaceLocalizerTest, SessionsAreIndependent) {
    detector_script_->answers = {{kFace}};
    auto localizer = make_localizer();
    LocalizationResult first = run(*localizer, 5);
    LocalizationResult second = run(*localizer, 5);

    ASSERT_EQ(first.detections.size(), second.detections.size());
    for (size_t i = 0; i < first.detections.size(); ++i) {
        EXPECT_EQ(first.detections[i], second.detections[i]);
    }
    EXPECT_EQ(second.stats.detector_invocations, first.stats.detector_invocations);
}

TEST_F(FaceLocalizerTest, RecognizesGrayscaleSource) {
    auto localizer = make_localizer();
    std::vector<cv::Mat> frames(2, cv::Mat(240, 320, CV_8UC3, cv::Scalar(80, 80, 80)));
    video::MemoryFrameSource source(frames, 30.0);
    localizer->localize(source);
    EXPECT_TRUE(localizer->grayscale_source());

    run(*localizer, 2);
    EXPECT_FALSE(localizer->grayscale_source());
}

TEST_F(FaceLocalizerTest, EmptySourceYieldsEmptyResult) {
    auto localizer = make_localizer();
    LocalizationResult result = run(*localizer, 0);
    EXPECT_TRUE(result.detections.empty());
    EXPECT_EQ(result.stats.frames_processed, 0);
    EXPECT_DOUBLE_EQ(result.stats.missed_ratio, 0.0);
}

TEST_F(FaceLocalizerTest, RejectsInvalidInterval) {
    auto localizer = make_localizer();
    EXPECT_THROW(localizer->begin(30.0, 0), std::invalid_argument);

    LocalizerConfig config;
    config.detect_interval = 0;
    EXPECT_THROW(make_localizer(config), std::invalid_argument);
}

TEST_F(FaceLocalizerTest, RequiresDetectorAndTrackers) {
    EXPECT_THROW(FaceLocalizer(LocalizerConfig(), nullptr, tracking::TrackerFactory()),
                 std::invalid_argument);
    EXPECT_THROW(FaceLocalizer(LocalizerConfig(),
                               std::make_unique<ScriptedDetector>(detector_script_),
                               tracking::TrackerFactory()),
                 std::invalid_argument);
}

TEST_F(FaceLocalizerTest, UnreadableVideoThrows) {
    auto localizer = make_localizer();
    EXPECT_THROW(localizer->localize("/nonexistent/clip.mp4"), std::runtime_error);
}

TEST(LocalizerStateTest, Names) {
    EXPECT_EQ(to_string(LocalizerState::Detect), "detect");
    EXPECT_EQ(to_string(LocalizerState::Track), "track");
    EXPECT_EQ(to_string(LocalizerState::Predict), "predict");
}

} // namespace anoncpp::test
