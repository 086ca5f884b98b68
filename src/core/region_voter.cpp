/**
 * @file    region_voter.cpp
 * @brief   Watermark localization implementation
 * @license MIT
 */

#include "core/region_voter.hpp"
#include "core/types.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace vwt {

namespace {

bool region_fits(const cv::Rect& region, cv::Size frame_size) {
    return region.width > 0 && region.height > 0 &&
           (region & cv::Rect(cv::Point(0, 0), frame_size)) == region;
}

// Otsu-binarized grayscale crop of a frame (region-sized, 0 / 255)
cv::Mat binarize_region(const cv::Mat& frame, const cv::Rect& region) {
    cv::Mat gray;
    const cv::Mat roi = frame(region);
    if (roi.channels() >= 3) {
        cv::cvtColor(roi, gray, roi.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    } else {
        gray = roi;
    }

    cv::Mat binary;
    cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return binary;
}

}  // anonymous namespace

RegionVoter::RegionVoter(const VoterConfig& config)
    : config_(config)
{
    if (config_.num_samples <= 0) {
        throw std::invalid_argument("Number of sample frames must be positive");
    }
    if (config_.min_vote_count <= 0) {
        throw std::invalid_argument("Minimum vote count must be positive");
    }
    if (config_.dilation_size <= 0) {
        throw std::invalid_argument("Dilation kernel size must be positive");
    }
}

std::vector<int> RegionVoter::sample_indices(const FrameSource& source) const {
    const auto total = static_cast<long long>(source.fps() * source.duration());

    std::vector<int> indices;
    indices.reserve(config_.num_samples);
    for (int i = 0; i < config_.num_samples; ++i) {
        indices.push_back(static_cast<int>(i * total / config_.num_samples));
    }
    return indices;
}

cv::Mat RegionVoter::first_valid_frame(FrameSource& source, double threshold) const {
    const double fps = source.fps();

    for (int index : sample_indices(source)) {
        cv::Mat frame = source.frame_at(index / fps);
        if (frame.empty()) continue;

        const cv::Scalar channel_mean = cv::mean(frame);
        double mean = 0.0;
        for (int c = 0; c < frame.channels(); ++c) mean += channel_mean[c];
        mean /= frame.channels();

        if (mean > threshold) {
            spdlog::debug("First valid frame: index {} (mean {:.1f})", index, mean);
            return frame;
        }
    }

    return source.frame_at(0.0);
}

cv::Mat RegionVoter::accumulate_votes(const std::vector<cv::Mat>& frames, const cv::Rect& region) {
    cv::Mat votes;

    for (const auto& frame : frames) {
        if (frame.empty()) continue;

        if (!region_fits(region, frame.size())) {
            throw PipelineError(ErrorCode::InvalidFrameData, fmt::format(
                "region ({},{} {}x{}) does not fit in {}x{} frame",
                region.x, region.y, region.width, region.height, frame.cols, frame.rows));
        }

        if (votes.empty()) {
            votes = cv::Mat::zeros(frame.size(), CV_32SC1);
        } else if (votes.size() != frame.size()) {
            throw PipelineError(ErrorCode::InvalidFrameData, "sampled frames differ in size");
        }

        const cv::Mat foreground = binarize_region(frame, region) == 255;
        cv::Mat votes_roi = votes(region);
        cv::add(votes_roi, cv::Scalar(1), votes_roi, foreground);
    }

    if (votes.empty()) {
        throw PipelineError(ErrorCode::InvalidFrameData, "no decodable frames to vote on");
    }
    return votes;
}

cv::Mat RegionVoter::threshold_votes(const cv::Mat& votes, int min_vote_count) {
    return votes >= min_vote_count;
}

cv::Mat RegionVoter::localize(FrameSource& source) const {
    if (!region_) {
        throw PipelineError(ErrorCode::RegionNotSet, "select a region before localizing the watermark");
    }

    const cv::Rect& region = *region_;
    if (!region_fits(region, source.frame_size())) {
        throw PipelineError(ErrorCode::InvalidFrameData, fmt::format(
            "region ({},{} {}x{}) outside {}x{} video",
            region.x, region.y, region.width, region.height,
            source.frame_size().width, source.frame_size().height));
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const double fps = source.fps();
    std::vector<cv::Mat> samples;
    samples.reserve(config_.num_samples);
    for (int index : sample_indices(source)) {
        cv::Mat frame = source.frame_at(index / fps);
        if (frame.empty()) {
            spdlog::warn("Sample frame {} could not be read, skipped", index);
            continue;
        }
        samples.push_back(std::move(frame));
    }

    const cv::Mat votes = accumulate_votes(samples, region);
    cv::Mat voted = threshold_votes(votes, config_.min_vote_count);

    const int voted_pixels = cv::countNonZero(voted);
    if (voted_pixels == 0) {
        throw PipelineError(ErrorCode::NoWatermarkDetected, fmt::format(
            "no pixel reached {} of {} votes", config_.min_vote_count, samples.size()));
    }

    const cv::Mat kernel = cv::Mat::ones(config_.dilation_size, config_.dilation_size, CV_8U);
    cv::Mat mask;
    cv::dilate(voted, mask, kernel, cv::Point(-1, -1), 2);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    spdlog::info("Watermark localized from {} samples in {} ms: {} voted px, {} px after dilation",
                 samples.size(), duration, voted_pixels, cv::countNonZero(mask));

    return mask;
}

// =============================================================================
// Geometry
// =============================================================================

BoundingBox bounding_box(const cv::Mat& mask, int margin) {
    if (mask.empty() || cv::countNonZero(mask) == 0) {
        throw PipelineError(ErrorCode::NoWatermarkDetected, "watermark mask is empty");
    }

    std::vector<cv::Point> points;
    cv::findNonZero(mask, points);
    const cv::Rect tight = cv::boundingRect(points);

    BoundingBox box;
    box.y_min = std::max(0, tight.y - margin);
    box.y_max = std::min(mask.rows, tight.y + tight.height + margin);
    box.x_min = std::max(0, tight.x - margin);
    box.x_max = std::min(mask.cols, tight.x + tight.width + margin);
    return box;
}

cv::Mat crop_mask(const cv::Mat& mask, const BoundingBox& box) {
    return mask(box.to_rect()).clone();
}

WatermarkGeometry make_geometry(const cv::Mat& mask, int margin) {
    const BoundingBox box = bounding_box(mask, margin);

    WatermarkGeometry geometry;
    geometry.frame_size = mask.size();
    geometry.mask = mask.clone();
    geometry.bounds = box.to_rect();
    geometry.region_mask = crop_mask(mask, box);

    spdlog::info("Processing bounds: ({},{}) {}x{} (margin {})",
                 geometry.bounds.x, geometry.bounds.y,
                 geometry.bounds.width, geometry.bounds.height, margin);
    return geometry;
}

}  // namespace vwt
