// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/video/frame_source.hpp>
#include <stdexcept>
#include <utility>

namespace anoncpp::video {

VideoFileSource::VideoFileSource(const std::string& path)
    : path_(path)
    , capture_(path)
    , fps_(0.0)
    , frame_count_(-1)
{
    if (!capture_.isOpened()) {
        throw std::runtime_error("Cannot open video: " + path);
    }
    fps_ = capture_.get(cv::CAP_PROP_FPS);
    if (!(fps_ > 0.0)) {
        fps_ = 0.0;
    }
    double count = capture_.get(cv::CAP_PROP_FRAME_COUNT);
    frame_count_ = count > 0.0 ? static_cast<int>(count) : -1;
}

bool VideoFileSource::next(cv::Mat& frame) {
    if (!capture_.read(frame)) {
        return false;
    }
    return !frame.empty();
}

MemoryFrameSource::MemoryFrameSource(std::vector<cv::Mat> frames, double fps)
    : frames_(std::move(frames))
    , fps_(fps)
    , position_(0)
{
}

bool MemoryFrameSource::next(cv::Mat& frame) {
    if (position_ >= frames_.size()) {
        return false;
    }
    frame = frames_[position_++];
    return true;
}

} // namespace anoncpp::video
