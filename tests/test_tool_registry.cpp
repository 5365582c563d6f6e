// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 anoncpp contributors

#include <gtest/gtest.h>
#include <anoncpp/pipeline/builtin_tools.hpp>
#include <anoncpp/pipeline/tool_registry.hpp>
#include <anoncpp/utils/detection_format.hpp>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

namespace anoncpp::pipeline::test {

namespace {

// Records calls and answers with fixed verdicts
class FakeTool : public PrivacyTool {
public:
    FakeTool(std::string name, bool apply_ok, bool verify_ok)
        : name_(std::move(name)), apply_ok_(apply_ok), verify_ok_(verify_ok) {}

    std::string name() const override { return name_; }

    ToolResult apply(const ToolArgs& args) override {
        applied++;
        last_args = args;
        ToolResult result;
        result.ok = apply_ok_;
        result.outputs.set(name_ + "_applied", true);
        result.outputs.set("native_fps", 25.0f);
        return result;
    }

    ToolResult verify(const ToolArgs& args) override {
        verified++;
        last_args = args;
        ToolResult result;
        result.ok = verify_ok_;
        result.message = name_ + (verify_ok_ ? " ok" : " failed");
        return result;
    }

    int applied = 0;
    int verified = 0;
    ToolArgs last_args;

private:
    std::string name_;
    bool apply_ok_;
    bool verify_ok_;
};

ToolArgs composite_args() {
    ToolArgs args;
    args.set("video_path", "clip.mp4");
    args.set("detections_path", "clip.detections.txt");
    args.set("output_path", "clip_blurred.mp4");
    return args;
}

} // namespace

TEST(ToolRegistryTest, AddFindAndGet) {
    ToolRegistry registry;
    PrivacyTool& added = registry.add(std::make_unique<FakeTool>("blur", true, true));

    EXPECT_EQ(&registry.get("blur"), &added);
    EXPECT_EQ(registry.find("blur"), &added);
    EXPECT_EQ(registry.find("pixelate"), nullptr);
    EXPECT_TRUE(registry.contains("blur"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_THROW(registry.get("pixelate"), std::out_of_range);
}

TEST(ToolRegistryTest, RejectsDuplicatesAndNull) {
    ToolRegistry registry;
    registry.add(std::make_unique<FakeTool>("blur", true, true));
    EXPECT_THROW(registry.add(std::make_unique<FakeTool>("blur", true, true)), std::invalid_argument);
    EXPECT_THROW(registry.add(nullptr), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, NamesAreSorted) {
    ToolRegistry registry;
    registry.add(std::make_unique<FakeTool>("mask", true, true));
    registry.add(std::make_unique<FakeTool>("blur", true, true));
    registry.add(std::make_unique<FakeTool>("detect_faces", true, true));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"blur", "detect_faces", "mask"}));
}

TEST(ToolRegistryTest, DefaultRegistryHoldsBuiltins) {
    std::unique_ptr<ToolRegistry> registry = make_default_registry(PipelineConfig());
    EXPECT_EQ(registry->names(), (std::vector<std::string>{"blur", "blur_faces", "detect_faces"}));
}

TEST(BlurFacesToolTest, RunsAllStagesWhenDetectionPasses) {
    FakeTool detect("detect_faces", true, true);
    FakeTool blur("blur", true, true);
    BlurFacesTool composite(detect, blur);

    ToolResult result = composite.apply(composite_args());
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(detect.applied, 1);
    EXPECT_EQ(detect.verified, 1);
    EXPECT_EQ(blur.applied, 1);
    EXPECT_EQ(blur.verified, 1);
    EXPECT_TRUE(result.outputs.get_bool("detection_pass", false));
    EXPECT_TRUE(result.outputs.get_bool("blur_pass", false));

    // Outputs of detection flow into later stages
    EXPECT_FLOAT_EQ(blur.last_args.get_float("native_fps", 0.0f), 25.0f);
    EXPECT_EQ(blur.last_args.get_string("output_path", ""), "clip_blurred.mp4");
}

TEST(BlurFacesToolTest, HaltsWhenDetectionFailsVerification) {
    FakeTool detect("detect_faces", true, false);
    FakeTool blur("blur", true, true);
    BlurFacesTool composite(detect, blur);

    ToolResult result = composite.apply(composite_args());
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.outputs.get_bool("detection_pass", true));
    EXPECT_EQ(blur.applied, 0);
    EXPECT_EQ(blur.verified, 0);
    EXPECT_NE(result.message.find("redaction skipped"), std::string::npos);
}

TEST(BlurFacesToolTest, ReportsBlurFailure) {
    FakeTool detect("detect_faces", true, true);
    FakeTool blur("blur", true, false);
    BlurFacesTool composite(detect, blur);

    ToolResult result = composite.apply(composite_args());
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.outputs.get_bool("blur_pass", true));
    EXPECT_EQ(blur.verified, 1);
}

TEST(BlurFacesToolTest, VerifyDelegatesToBlur) {
    FakeTool detect("detect_faces", true, true);
    FakeTool blur("blur", true, false);
    BlurFacesTool composite(detect, blur);

    EXPECT_FALSE(composite.verify(composite_args()).ok);
    EXPECT_EQ(blur.verified, 1);
    EXPECT_EQ(detect.verified, 0);
}

class DetectFacesToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "anoncpp_tool_test.detections.txt";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write_counts(const std::vector<int>& counts) {
        std::vector<DetectionRecord> records;
        for (size_t i = 0; i < counts.size(); ++i) {
            DetectionRecord record;
            record.frame_index = static_cast<int>(i);
            record.outcome = counts[i] > 0 ? DetectionOutcome::Success : DetectionOutcome::Failed;
            record.boxes.assign(static_cast<size_t>(counts[i]), BoundingBox{0, 0, 10, 10});
            records.push_back(record);
        }
        utils::write_detections(path_, records);
    }

    std::filesystem::path path_;
};

TEST_F(DetectFacesToolTest, VerifiesDetectionsFile) {
    write_counts({1, 1, 1, 1, 0, 0, 1, 1, 1, 1});
    DetectFacesTool tool{PipelineConfig()};

    ToolArgs args;
    args.set("detections_path", path_.string());
    args.set("native_fps", 30.0f);
    ToolResult result = tool.verify(args);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.outputs.get_int("gap_count", 0), 1);
    EXPECT_EQ(result.outputs.get_int("missing_frames", 0), 1);
    EXPECT_FLOAT_EQ(result.outputs.get_float("miss_ratio", 0.0f), 0.1f);
}

TEST_F(DetectFacesToolTest, SteadyDetectionsPass) {
    write_counts(std::vector<int>(50, 2));
    DetectFacesTool tool{PipelineConfig()};

    ToolArgs args;
    args.set("detections_path", path_.string());
    args.set("native_fps", 30);
    EXPECT_TRUE(tool.verify(args).ok);
}

TEST_F(DetectFacesToolTest, RequiresArguments) {
    DetectFacesTool tool{PipelineConfig()};
    EXPECT_THROW(tool.apply(ToolArgs()), std::invalid_argument);
    EXPECT_THROW(tool.verify(ToolArgs()), std::invalid_argument);
}

TEST_F(DetectFacesToolTest, UnknownFrameRateStillGivesVerdict) {
    write_counts({1, 1, 1, 1, 0, 0, 1, 1, 1, 1});
    DetectFacesTool tool{PipelineConfig()};

    ToolArgs args;
    args.set("detections_path", path_.string());
    args.set("native_fps", 0.0f);
    ToolResult with_zero;
    ASSERT_NO_THROW(with_zero = tool.verify(args));

    // Zero threshold: the gap is not short, so the short-gap ratio passes
    EXPECT_TRUE(with_zero.ok);
    EXPECT_EQ(with_zero.outputs.get_int("gap_count", 0), 1);
    EXPECT_FLOAT_EQ(with_zero.outputs.get_float("short_gap_ratio", 1.0f), 0.0f);

    ToolArgs no_fps;
    no_fps.set("detections_path", path_.string());
    EXPECT_EQ(tool.verify(no_fps).ok, with_zero.ok);
}

TEST(BlurToolTest, RequiresArguments) {
    BlurTool tool;
    EXPECT_THROW(tool.apply(ToolArgs()), std::invalid_argument);
    EXPECT_THROW(tool.verify(ToolArgs()), std::invalid_argument);
}

TEST(BlurToolTest, RejectsEvenKernelOverride) {
    BlurTool tool;
    ToolArgs args;
    args.set("output_path", "/nonexistent/out.mp4");
    args.set("detections_path", "/nonexistent/clip.detections.txt");
    args.set("kernel_size", 20);
    EXPECT_THROW(tool.verify(args), std::invalid_argument);
}

} // namespace anoncpp::pipeline::test
