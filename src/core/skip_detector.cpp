/**
 * @file    skip_detector.cpp
 * @brief   Temporal skip decision implementation
 * @license MIT
 */

#include "core/skip_detector.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>

namespace vwt {

namespace {

cv::Mat to_gray_f(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() >= 3) {
        cv::cvtColor(image, gray, image.channels() == 4
                     ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    } else {
        gray = image;
    }
    cv::Mat gray_f;
    gray.convertTo(gray_f, CV_64F);
    return gray_f;
}

}  // anonymous namespace

TemporalSkipDetector::TemporalSkipDetector(const SkipConfig& config)
    : config_(config)
{
    if (config_.keyframe_interval <= 0) {
        throw std::invalid_argument("Keyframe interval must be positive");
    }
}

bool TemporalSkipDetector::decide(std::int64_t frame_index, const cv::Mat& region) const {
    if (frame_index % config_.keyframe_interval == 0) {
        return true;
    }

    if (has_reference()) {
        const double diff = frame_difference(region, reference_);
        if (diff > config_.scene_change_threshold) {
            spdlog::debug("Frame {}: region changed (mse={:.2f} > {:.2f})",
                          frame_index, diff, config_.scene_change_threshold);
            return true;
        }
    }

    return false;
}

void TemporalSkipDetector::update_reference(const cv::Mat& region) {
    if (region.empty()) return;
    reference_ = region.clone();
}

double TemporalSkipDetector::frame_difference(const cv::Mat& a, const cv::Mat& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return std::numeric_limits<double>::infinity();
    }

    cv::Mat diff;
    cv::subtract(to_gray_f(a), to_gray_f(b), diff);
    return cv::mean(diff.mul(diff))[0];
}

}  // namespace vwt
