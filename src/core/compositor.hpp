/**
 * @file    compositor.hpp
 * @brief   Feathered re-insertion of regenerated region content
 * @license MIT
 *
 * @details
 * Blend math, per channel, inside the region bounds:
 *   out = feather * regenerated + (1 - feather) * raw
 *
 * feather is the binary watermark mask Gaussian-blurred and scaled to
 * [0, 1], so the transition at mask edges has no visible seam.
 */

#pragma once

#include <opencv2/core.hpp>

namespace vwt {

inline constexpr int kDefaultFeatherKernel = 21;

/**
 * Build a feather mask (CV_32FC1, 0.0 - 1.0) from a binary mask
 *
 * @param mask         CV_8UC1 mask, cells 0 or 255
 * @param kernel_size  Odd Gaussian kernel side
 */
[[nodiscard]] cv::Mat make_feather_mask(const cv::Mat& mask, int kernel_size = kDefaultFeatherKernel);

class RegionCompositor {
public:
    /**
     * @param region_mask  Binary mask cropped to the region bounds
     * @param kernel_size  Odd Gaussian kernel side for feathering
     */
    explicit RegionCompositor(const cv::Mat& region_mask, int kernel_size = kDefaultFeatherKernel);

    /**
     * Blend regenerated content into the frame
     *
     * @param frame        Full BGR frame, modified in place inside bounds only
     * @param bounds       Region bounds within the frame
     * @param regenerated  Regenerated region (bounds-sized, CV_8UC3)
     * @param raw          Original region pixels (bounds-sized, CV_8UC3)
     */
    void blend(cv::Mat& frame, const cv::Rect& bounds,
               const cv::Mat& regenerated, const cv::Mat& raw) const;

    [[nodiscard]] const cv::Mat& feather() const noexcept { return feather_; }

private:
    cv::Mat feather_;     // CV_32FC1, 0.0 - 1.0
    cv::Mat feather_3c_;  // Same, replicated to 3 channels
};

}  // namespace vwt
