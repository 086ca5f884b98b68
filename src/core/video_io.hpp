/**
 * @file    video_io.hpp
 * @brief   Frame source / frame sink interfaces and OpenCV adapters
 * @license MIT
 *
 * @details
 * The pipeline reads frames through FrameSource in two ways:
 *   - random access by timestamp (watermark localization samples a few)
 *   - ordered sequential iteration (the per-frame loop)
 *
 * Frames are 8-bit BGR cv::Mat of a fixed size for the whole stream.
 */

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <filesystem>

namespace vwt {

/**
 * Ordered, seekable stream of video frames
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    [[nodiscard]] virtual int frame_count() const = 0;
    [[nodiscard]] virtual double fps() const = 0;
    [[nodiscard]] virtual cv::Size frame_size() const = 0;

    [[nodiscard]] virtual double duration() const {
        return fps() > 0.0 ? frame_count() / fps() : 0.0;
    }

    /**
     * Random access retrieval
     *
     * @param seconds  Timestamp from the start of the stream
     * @return         The frame shown at that time, empty if out of range
     */
    virtual cv::Mat frame_at(double seconds) = 0;

    // Restart sequential iteration at frame 0
    virtual void rewind() = 0;

    // Next frame in order; false at end of stream
    virtual bool read(cv::Mat& frame) = 0;
};

/**
 * Consumer of processed frames
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void write(const cv::Mat& frame) = 0;
    virtual void close() = 0;
};

/**
 * FrameSource over a video file, backed by cv::VideoCapture
 */
class VideoFileSource final : public FrameSource {
public:
    explicit VideoFileSource(const std::filesystem::path& path);

    [[nodiscard]] int frame_count() const override { return frame_count_; }
    [[nodiscard]] double fps() const override { return fps_; }
    [[nodiscard]] cv::Size frame_size() const override { return frame_size_; }

    cv::Mat frame_at(double seconds) override;
    void rewind() override;
    bool read(cv::Mat& frame) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    cv::VideoCapture capture_;
    int frame_count_{0};
    double fps_{0.0};
    cv::Size frame_size_;
};

/**
 * FrameSink writing an MPEG-4 file, backed by cv::VideoWriter
 */
class VideoFileSink final : public FrameSink {
public:
    VideoFileSink(const std::filesystem::path& path, double fps, cv::Size frame_size);
    ~VideoFileSink() override;

    VideoFileSink(const VideoFileSink&) = delete;
    VideoFileSink& operator=(const VideoFileSink&) = delete;

    void write(const cv::Mat& frame) override;
    void close() override;

private:
    std::filesystem::path path_;
    cv::VideoWriter writer_;
    cv::Size frame_size_;
};

/**
 * Check whether a path looks like a readable video container
 * (by extension, then by opening it)
 */
[[nodiscard]] bool is_valid_video_file(const std::filesystem::path& path);

}  // namespace vwt
