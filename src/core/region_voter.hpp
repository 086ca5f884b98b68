/**
 * @file    region_voter.hpp
 * @brief   Watermark localization by multi-frame voting
 * @license MIT
 *
 * @details
 * A fixed watermark stays put while the content under it moves. Sampling a
 * few frames spread over the video and binarizing the region of interest in
 * each one, the watermark pixels are foreground in most samples while
 * background pixels flip around.
 *
 * Algorithm:
 *   1. Sample N frames at indices i * total / N
 *   2. Per sample: crop to region, grayscale, Otsu threshold
 *   3. Per pixel: count samples marking it foreground
 *   4. Keep pixels with count >= min_vote_count
 *   5. Dilate (square kernel, 2 iterations) to absorb anti-aliasing halos
 */

#pragma once

#include "core/video_io.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

namespace vwt {

struct VoterConfig {
    int num_samples{10};
    int min_vote_count{7};
    int dilation_size{7};
};

/**
 * Bounding box in frame coordinates, half-open: [y_min, y_max) x [x_min, x_max)
 */
struct BoundingBox {
    int y_min{0};
    int y_max{0};
    int x_min{0};
    int x_max{0};

    [[nodiscard]] cv::Rect to_rect() const noexcept {
        return cv::Rect(x_min, y_min, x_max - x_min, y_max - y_min);
    }
};

/**
 * Watermark geometry shared read-only by every video of a batch
 *
 * All videos of a batch are assumed to share the frame size of the video
 * the geometry was computed from; the pipeline checks it per video.
 */
struct WatermarkGeometry {
    cv::Size frame_size;   // Frame size the mask was computed for
    cv::Mat mask;          // Frame-sized CV_8UC1 mask, 0 / 255
    cv::Rect bounds;       // Processing bounds (mask bbox + margin)
    cv::Mat region_mask;   // mask cropped to bounds
};

class RegionVoter {
public:
    explicit RegionVoter(const VoterConfig& config = {});

    void set_region(const cv::Rect& region) { region_ = region; }
    [[nodiscard]] const std::optional<cv::Rect>& region() const noexcept { return region_; }
    [[nodiscard]] const VoterConfig& config() const noexcept { return config_; }

    /**
     * Build the frame-sized watermark mask from sampled frames
     *
     * @throws PipelineError  RegionNotSet, InvalidFrameData or NoWatermarkDetected
     */
    [[nodiscard]] cv::Mat localize(FrameSource& source) const;

    // Frame indices sampled for a video
    [[nodiscard]] std::vector<int> sample_indices(const FrameSource& source) const;

    /**
     * First sampled frame whose mean intensity exceeds threshold
     * (skips black intros); falls back to frame 0
     */
    [[nodiscard]] cv::Mat first_valid_frame(FrameSource& source, double threshold = 10.0) const;

    /**
     * Per-pixel foreground vote counts (frame-sized CV_32SC1, zero outside region)
     *
     * @throws PipelineError  InvalidFrameData when a frame cannot hold the region
     */
    [[nodiscard]] static cv::Mat accumulate_votes(const std::vector<cv::Mat>& frames,
                                                  const cv::Rect& region);

    // Pixels with at least min_vote_count votes (CV_8UC1, 0 / 255)
    [[nodiscard]] static cv::Mat threshold_votes(const cv::Mat& votes, int min_vote_count);

private:
    VoterConfig config_;
    std::optional<cv::Rect> region_;
};

/**
 * Tight bounding box of the mask foreground, grown by margin and clamped
 *
 * @throws PipelineError  NoWatermarkDetected for an all-zero mask
 */
[[nodiscard]] BoundingBox bounding_box(const cv::Mat& mask, int margin = 50);

// Sub-grid of mask inside box (deep copy)
[[nodiscard]] cv::Mat crop_mask(const cv::Mat& mask, const BoundingBox& box);

// Geometry for a frame-sized mask
[[nodiscard]] WatermarkGeometry make_geometry(const cv::Mat& mask, int margin = 50);

}  // namespace vwt
