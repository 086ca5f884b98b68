/**
 * @file    region_provider.hpp
 * @brief   Source of the initial watermark region
 * @license MIT
 */

#pragma once

#include "core/video_io.hpp"

#include <opencv2/core.hpp>

#include <string_view>

namespace vwt {

/**
 * Supplies the region of interest, in source pixel coordinates.
 * Invoked at most once per batch.
 */
class RegionProvider {
public:
    virtual ~RegionProvider() = default;
    virtual cv::Rect select(FrameSource& source) = 0;
};

/**
 * Region given up front (command line, config file)
 */
class FixedRegionProvider final : public RegionProvider {
public:
    explicit FixedRegionProvider(const cv::Rect& region) : region_(region) {}

    cv::Rect select(FrameSource& source) override;

private:
    cv::Rect region_;
};

/**
 * Parse "x,y,w,h" into a rectangle
 *
 * @throws std::invalid_argument  Malformed text or non-positive size
 */
[[nodiscard]] cv::Rect parse_region(std::string_view text);

}  // namespace vwt
