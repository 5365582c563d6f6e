// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 anoncpp contributors

#include <gtest/gtest.h>
#include <anoncpp/utils/detection_format.hpp>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace anoncpp::utils::test {

TEST(DetectionFormatTest, FormatsRecordAsLine) {
    DetectionRecord record;
    record.frame_index = 7;
    record.source = DetectionSource::Tracker;
    record.outcome = DetectionOutcome::Success;
    record.boxes = {{10, 20, 30, 40}, {1, 2, 3, 4}};
    EXPECT_EQ(format_detection_record(record), "7,tracker,success,2,10,20,30,40,1,2,3,4");
}

TEST(DetectionFormatTest, PredictionsHaveNoOutcome) {
    DetectionRecord record;
    record.frame_index = 3;
    record.source = DetectionSource::Kalman;
    record.boxes = {{5, 5, 10, 10}};
    std::string line = format_detection_record(record);
    EXPECT_EQ(line, "3,kalman,-,1,5,5,10,10");
    EXPECT_FALSE(parse_detection_record(line).outcome.has_value());
}

TEST(DetectionFormatTest, ParsesEmptyFrame) {
    DetectionRecord record = parse_detection_record("12,detector,failed,0");
    EXPECT_EQ(record.frame_index, 12);
    EXPECT_EQ(record.source, DetectionSource::Detector);
    EXPECT_EQ(record.outcome, DetectionOutcome::Failed);
    EXPECT_TRUE(record.boxes.empty());
}

TEST(DetectionFormatTest, RejectsMalformedLines) {
    EXPECT_THROW(parse_detection_record("1,detector"), std::runtime_error);
    EXPECT_THROW(parse_detection_record("x,detector,success,0"), std::runtime_error);
    EXPECT_THROW(parse_detection_record("1,camera,success,0"), std::runtime_error);
    EXPECT_THROW(parse_detection_record("1,detector,success,2,1,2,3,4"), std::runtime_error);
    EXPECT_THROW(parse_detection_record("1,detector,success,1,1,2,-3,4"), std::runtime_error);
}

TEST(DetectionFormatTest, StreamKeepsOrderAndSkipsComments) {
    std::vector<DetectionRecord> detections(3);
    for (int i = 0; i < 3; ++i) {
        detections[i].frame_index = i;
        detections[i].outcome = DetectionOutcome::Success;
        detections[i].boxes = {{i, i, 8, 8}};
    }

    std::stringstream ss;
    write_detections(ss, detections);
    EXPECT_EQ(ss.str()[0], '#');

    std::vector<DetectionRecord> read = read_detections(ss);
    EXPECT_EQ(read, detections);
}

TEST(DetectionFormatTest, ReportsLineOfBadRecord) {
    std::istringstream is("# header\r\n0,detector,failed,0\r\n\nbad line\n");
    try {
        read_detections(is);
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Line 4:", 0), 0u) << e.what();
    }
}

TEST(DetectionFormatTest, MissingFileThrows) {
    EXPECT_THROW(read_detections(std::filesystem::path("/nonexistent/detections.txt")),
                 std::runtime_error);
}

TEST(DetectionFormatTest, FileRoundTripCreatesDirectories) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "anoncpp_format_test";
    std::filesystem::remove_all(dir);
    std::filesystem::path path = dir / "nested" / "clip.detections.txt";

    DetectionRecord record;
    record.frame_index = 0;
    record.outcome = DetectionOutcome::Success;
    record.boxes = {{4, 5, 6, 7}};
    write_detections(path, {record});

    std::vector<DetectionRecord> read = read_detections(path);
    ASSERT_EQ(read.size(), 1u);
    EXPECT_EQ(read[0], record);
    std::filesystem::remove_all(dir);
}

} // namespace anoncpp::utils::test
