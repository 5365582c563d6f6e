// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>
#include <vector>

namespace anoncpp::video {

/**
 * Pull-based, single-pass frame stream.
 * A source cannot be rewound; reopen the underlying media to read it again.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * Read the next frame
     * @param frame Receives the frame on success
     * @return false once the stream is exhausted
     */
    virtual bool next(cv::Mat& frame) = 0;

    /**
     * Native frame rate, 0 when unknown
     */
    virtual double fps() const = 0;

    /**
     * Number of frames if the container reports it, -1 otherwise
     */
    virtual int frame_count() const = 0;
};

/**
 * Frames decoded from a video file with cv::VideoCapture
 */
class VideoFileSource : public FrameSource {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit VideoFileSource(const std::string& path);

    bool next(cv::Mat& frame) override;
    double fps() const override { return fps_; }
    int frame_count() const override { return frame_count_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    cv::VideoCapture capture_;
    double fps_;
    int frame_count_;
};

/**
 * Frames held in memory, served in order
 */
class MemoryFrameSource : public FrameSource {
public:
    MemoryFrameSource(std::vector<cv::Mat> frames, double fps);

    bool next(cv::Mat& frame) override;
    double fps() const override { return fps_; }
    int frame_count() const override { return static_cast<int>(frames_.size()); }

private:
    std::vector<cv::Mat> frames_;
    double fps_;
    size_t position_;
};

} // namespace anoncpp::video
