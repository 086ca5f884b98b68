/**
 * @file    video_io.cpp
 * @brief   OpenCV-backed frame source and sink
 * @license MIT
 */

#include "core/video_io.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace vwt {

namespace {

// Normalize decoder output to 8-bit BGR
void ensure_bgr(cv::Mat& frame) {
    if (frame.channels() == 4) {
        cv::cvtColor(frame, frame, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 1) {
        cv::cvtColor(frame, frame, cv::COLOR_GRAY2BGR);
    }
}

}  // anonymous namespace

// =============================================================================
// VideoFileSource
// =============================================================================

VideoFileSource::VideoFileSource(const std::filesystem::path& path)
    : path_(path)
    , capture_(path.string())
{
    if (!capture_.isOpened()) {
        throw std::runtime_error("Cannot open video file: " + to_utf8(path));
    }

    fps_ = capture_.get(cv::CAP_PROP_FPS);
    frame_count_ = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
    frame_size_ = cv::Size(
        static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    if (fps_ <= 0.0) {
        throw std::runtime_error("Invalid FPS in video file: " + to_utf8(path));
    }

    spdlog::debug("Opened {}: {}x{}, {:.2f} fps, {} frames",
                  path.filename(), frame_size_.width, frame_size_.height,
                  fps_, frame_count_);
}

cv::Mat VideoFileSource::frame_at(double seconds) {
    const auto index = static_cast<int>(std::lround(seconds * fps_));
    // Some containers report no frame count; the read then decides
    if (index < 0 || (frame_count_ > 0 && index >= frame_count_)) {
        return {};
    }

    capture_.set(cv::CAP_PROP_POS_FRAMES, index);

    cv::Mat frame;
    if (!capture_.read(frame)) {
        spdlog::warn("Failed to decode frame {} of {}", index, path_.filename());
        return {};
    }
    ensure_bgr(frame);
    return frame;
}

void VideoFileSource::rewind() {
    capture_.set(cv::CAP_PROP_POS_FRAMES, 0);
}

bool VideoFileSource::read(cv::Mat& frame) {
    if (!capture_.read(frame) || frame.empty()) {
        return false;
    }
    ensure_bgr(frame);
    return true;
}

// =============================================================================
// VideoFileSink
// =============================================================================

VideoFileSink::VideoFileSink(const std::filesystem::path& path, double fps, cv::Size frame_size)
    : path_(path)
    , frame_size_(frame_size)
{
    const int fourcc = cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    writer_.open(path.string(), fourcc, fps, frame_size);
    if (!writer_.isOpened()) {
        throw std::runtime_error("Cannot create video output file: " + to_utf8(path));
    }
}

VideoFileSink::~VideoFileSink() {
    close();
}

void VideoFileSink::write(const cv::Mat& frame) {
    if (!writer_.isOpened()) {
        throw std::runtime_error("Write to closed video file: " + to_utf8(path_));
    }
    if (frame.size() != frame_size_ || frame.type() != CV_8UC3) {
        throw std::runtime_error("Frame does not match output format of " + to_utf8(path_));
    }
    writer_.write(frame);
}

void VideoFileSink::close() {
    if (writer_.isOpened()) {
        writer_.release();
        spdlog::debug("Closed {}", path_.filename());
    }
}

// =============================================================================
// Helpers
// =============================================================================

bool is_valid_video_file(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext != ".mp4" && ext != ".mov" && ext != ".avi" &&
        ext != ".mkv" && ext != ".webm" && ext != ".m4v") {
        return false;
    }

    cv::VideoCapture probe(path.string());
    if (!probe.isOpened()) {
        spdlog::warn("Invalid video file: {}", path);
        return false;
    }
    return true;
}

}  // namespace vwt
