/**
 * @file    regenerator.hpp
 * @brief   Region regeneration service interface
 * @license MIT
 *
 * @details
 * The regenerator synthesizes replacement pixels for the masked part of a
 * region. The pipeline treats it as an opaque, side-effect-free function:
 *   regenerate(region, mask, config) -> pixels of the same size
 *
 * InpaintRegenerator is the built-in implementation (OpenCV Telea
 * inpainting). Heavier engines plug in by implementing RegionRegenerator.
 */

#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>

namespace vwt {

/**
 * How oversized regions are handled before regeneration
 */
enum class SizeStrategy {
    AsIs,                // Process at native resolution
    ResizeThenRestore,   // Downscale to resize_limit, regenerate, upscale
    CropThenRestore      // Regenerate only the mask bbox + crop_margin
};

[[nodiscard]] constexpr std::string_view to_string(SizeStrategy strategy) noexcept {
    switch (strategy) {
        case SizeStrategy::AsIs:              return "original";
        case SizeStrategy::ResizeThenRestore: return "resize";
        case SizeStrategy::CropThenRestore:   return "crop";
        default:                              return "unknown";
    }
}

// Accepts "original" / "as-is", "resize", "crop"
[[nodiscard]] std::optional<SizeStrategy> parse_size_strategy(std::string_view text) noexcept;

struct RegenerationConfig {
    int steps{25};                 // Refinement steps (inpaint radius for InpaintRegenerator)
    SizeStrategy strategy{SizeStrategy::AsIs};
    int crop_margin{32};
    int crop_trigger_size{2048};   // Crop strategy applies above this side length
    int resize_limit{2048};        // Max working side length
};

class RegionRegenerator {
public:
    virtual ~RegionRegenerator() = default;

    /**
     * @param region  BGR 8-bit region pixels
     * @param mask    CV_8UC1, 255 where content must be synthesized
     * @param config  Regeneration parameters
     * @return        Regenerated pixels, same size as region; any depth,
     *                normalized by the caller
     */
    virtual cv::Mat regenerate(const cv::Mat& region, const cv::Mat& mask,
                               const RegenerationConfig& config) = 0;
};

/**
 * Bring regenerator output to 8-bit
 *
 * Floating output with max <= 1.0 is scaled to 0-255; anything else is
 * saturate-cast.
 */
[[nodiscard]] cv::Mat normalize_regenerated(const cv::Mat& output);

/**
 * Regenerator backed by cv::inpaint (Telea)
 */
class InpaintRegenerator final : public RegionRegenerator {
public:
    cv::Mat regenerate(const cv::Mat& region, const cv::Mat& mask,
                       const RegenerationConfig& config) override;

private:
    static cv::Mat inpaint_native(const cv::Mat& region, const cv::Mat& mask, int steps);
    static cv::Mat inpaint_resized(const cv::Mat& region, const cv::Mat& mask,
                                   const RegenerationConfig& config);
    static cv::Mat inpaint_cropped(const cv::Mat& region, const cv::Mat& mask,
                                   const RegenerationConfig& config);
};

}  // namespace vwt
