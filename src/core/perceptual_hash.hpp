/**
 * @file    perceptual_hash.hpp
 * @brief   DCT perceptual signature of region content
 * @license MIT
 *
 * @details
 * Signature pipeline:
 *   1. Resize region to 64x64
 *   2. Grayscale, downsample to 32x32
 *   3. 2D DCT, keep the 8x8 low-frequency block
 *   4. Bit = coefficient > median of the block
 *
 * Visually similar content yields signatures with a small Hamming distance.
 */

#pragma once

#include <opencv2/core.hpp>

#include <bit>
#include <cstdint>

namespace vwt {

using PerceptualSignature = std::uint64_t;

/**
 * Compute the 64-bit perceptual signature of an image region
 *
 * @param region  BGR or grayscale 8-bit image, non-empty
 * @return        Signature bits, MSB = DCT coefficient (0, 0)
 */
[[nodiscard]] PerceptualSignature compute_signature(const cv::Mat& region);

[[nodiscard]] inline int hamming_distance(PerceptualSignature a, PerceptualSignature b) noexcept {
    return std::popcount(a ^ b);
}

}  // namespace vwt
