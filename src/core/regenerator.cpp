/**
 * @file    regenerator.cpp
 * @brief   Output normalization and the OpenCV inpainting regenerator
 * @license MIT
 */

#include "core/regenerator.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace vwt {

std::optional<SizeStrategy> parse_size_strategy(std::string_view text) noexcept {
    if (text == "original" || text == "as-is") return SizeStrategy::AsIs;
    if (text == "resize") return SizeStrategy::ResizeThenRestore;
    if (text == "crop") return SizeStrategy::CropThenRestore;
    return std::nullopt;
}

cv::Mat normalize_regenerated(const cv::Mat& output) {
    if (output.empty() || output.depth() == CV_8U) {
        return output;
    }

    cv::Mat normalized;
    if (output.depth() == CV_32F || output.depth() == CV_64F) {
        double min_val = 0.0, max_val = 0.0;
        cv::minMaxLoc(output.reshape(1), &min_val, &max_val);
        const double scale = (max_val <= 1.0) ? 255.0 : 1.0;
        output.convertTo(normalized, CV_8U, scale);
    } else {
        output.convertTo(normalized, CV_8U);
    }
    return normalized;
}

// =============================================================================
// InpaintRegenerator
// =============================================================================

cv::Mat InpaintRegenerator::regenerate(const cv::Mat& region, const cv::Mat& mask,
                                       const RegenerationConfig& config) {
    if (region.empty() || region.depth() != CV_8U ||
        (region.channels() != 1 && region.channels() != 3)) {
        throw std::invalid_argument("Inpainting needs an 8-bit gray or BGR region");
    }
    if (mask.size() != region.size()) {
        throw std::invalid_argument("Inpainting mask does not match region size");
    }

    const cv::Mat binary = mask > 0;
    const int longest = std::max(region.cols, region.rows);

    switch (config.strategy) {
        case SizeStrategy::ResizeThenRestore:
            if (longest > config.resize_limit) {
                return inpaint_resized(region, binary, config);
            }
            break;
        case SizeStrategy::CropThenRestore:
            if (longest > config.crop_trigger_size) {
                return inpaint_cropped(region, binary, config);
            }
            break;
        case SizeStrategy::AsIs:
            break;
    }
    return inpaint_native(region, binary, config.steps);
}

cv::Mat InpaintRegenerator::inpaint_native(const cv::Mat& region, const cv::Mat& mask, int steps) {
    const double radius = std::clamp(steps / 5, 1, 25);

    cv::Mat result;
    cv::inpaint(region, mask, result, radius, cv::INPAINT_TELEA);
    return result;
}

cv::Mat InpaintRegenerator::inpaint_resized(const cv::Mat& region, const cv::Mat& mask,
                                            const RegenerationConfig& config) {
    const double scale = static_cast<double>(config.resize_limit) /
                         std::max(region.cols, region.rows);
    const cv::Size working(std::max(1, static_cast<int>(region.cols * scale)),
                           std::max(1, static_cast<int>(region.rows * scale)));

    spdlog::debug("Regenerate: resize {}x{} -> {}x{}",
                  region.cols, region.rows, working.width, working.height);

    cv::Mat small_region, small_mask;
    cv::resize(region, small_region, working, 0, 0, cv::INTER_AREA);
    cv::resize(mask, small_mask, working, 0, 0, cv::INTER_NEAREST);

    cv::Mat small_result = inpaint_native(small_region, small_mask, config.steps);

    cv::Mat restored;
    cv::resize(small_result, restored, region.size(), 0, 0, cv::INTER_CUBIC);

    // Keep native pixels outside the mask
    cv::Mat result = region.clone();
    restored.copyTo(result, mask);
    return result;
}

cv::Mat InpaintRegenerator::inpaint_cropped(const cv::Mat& region, const cv::Mat& mask,
                                            const RegenerationConfig& config) {
    std::vector<cv::Point> points;
    cv::findNonZero(mask, points);
    if (points.empty()) {
        return region.clone();
    }

    cv::Rect crop = cv::boundingRect(points);
    crop.x -= config.crop_margin;
    crop.y -= config.crop_margin;
    crop.width += 2 * config.crop_margin;
    crop.height += 2 * config.crop_margin;
    crop &= cv::Rect(0, 0, region.cols, region.rows);

    spdlog::debug("Regenerate: crop ({},{}) {}x{} of {}x{}",
                  crop.x, crop.y, crop.width, crop.height, region.cols, region.rows);

    cv::Mat result = region.clone();
    cv::Mat patch = inpaint_native(region(crop), mask(crop), config.steps);
    patch.copyTo(result(crop));
    return result;
}

}  // namespace vwt
