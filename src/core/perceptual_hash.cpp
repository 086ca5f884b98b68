/**
 * @file    perceptual_hash.cpp
 * @brief   DCT perceptual signature implementation
 * @license MIT
 */

#include "core/perceptual_hash.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace vwt {

namespace {

constexpr int kNormalizedSide = 64;  // Region is first normalized to this
constexpr int kDctSide = 32;         // Grayscale side fed to the DCT
constexpr int kHashSide = 8;         // Low-frequency block kept (8x8 = 64 bits)

}  // anonymous namespace

PerceptualSignature compute_signature(const cv::Mat& region) {
    if (region.empty()) {
        throw std::invalid_argument("compute_signature: empty region");
    }

    cv::Mat normalized;
    cv::resize(region, normalized, cv::Size(kNormalizedSide, kNormalizedSide),
               0, 0, cv::INTER_LINEAR);

    cv::Mat gray;
    if (normalized.channels() >= 3) {
        cv::cvtColor(normalized, gray, normalized.channels() == 4
                     ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    } else {
        gray = normalized;
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(kDctSide, kDctSide), 0, 0, cv::INTER_AREA);

    cv::Mat small_f;
    small.convertTo(small_f, CV_32F);

    cv::Mat coeffs;
    cv::dct(small_f, coeffs);

    std::array<float, kHashSide * kHashSide> low{};
    for (int y = 0; y < kHashSide; ++y) {
        for (int x = 0; x < kHashSide; ++x) {
            low[y * kHashSide + x] = coeffs.at<float>(y, x);
        }
    }

    // Median over the whole 8x8 block (DC included)
    auto sorted = low;
    std::sort(sorted.begin(), sorted.end());
    constexpr std::size_t mid = sorted.size() / 2;
    const float median = (sorted[mid - 1] + sorted[mid]) * 0.5f;

    PerceptualSignature signature = 0;
    for (float coeff : low) {
        signature = (signature << 1) | (coeff > median ? 1u : 0u);
    }
    return signature;
}

}  // namespace vwt
