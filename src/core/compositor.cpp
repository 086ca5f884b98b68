/**
 * @file    compositor.cpp
 * @brief   Feathered compositor implementation
 * @license MIT
 */

#include "core/compositor.hpp"

#include <opencv2/imgproc.hpp>

#include <stdexcept>
#include <vector>

namespace vwt {

cv::Mat make_feather_mask(const cv::Mat& mask, int kernel_size) {
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw std::invalid_argument("Feather mask requires a non-empty CV_8UC1 mask");
    }
    if (kernel_size <= 0 || kernel_size % 2 == 0) {
        throw std::invalid_argument("Feather kernel size must be positive and odd");
    }

    cv::Mat mask_f;
    mask.convertTo(mask_f, CV_32F);

    cv::Mat feather;
    cv::GaussianBlur(mask_f, feather, cv::Size(kernel_size, kernel_size), 0);
    feather /= 255.0;
    return feather;
}

RegionCompositor::RegionCompositor(const cv::Mat& region_mask, int kernel_size)
    : feather_(make_feather_mask(region_mask, kernel_size))
{
    cv::merge(std::vector<cv::Mat>{feather_, feather_, feather_}, feather_3c_);
}

void RegionCompositor::blend(cv::Mat& frame, const cv::Rect& bounds,
                             const cv::Mat& regenerated, const cv::Mat& raw) const {
    if (bounds.size() != feather_.size()) {
        throw std::invalid_argument("Blend bounds do not match the feather mask");
    }
    if (regenerated.size() != bounds.size() || raw.size() != bounds.size()) {
        throw std::invalid_argument("Blend inputs do not match the region bounds");
    }
    if ((bounds & cv::Rect(0, 0, frame.cols, frame.rows)) != bounds) {
        throw std::invalid_argument("Blend bounds exceed the frame");
    }

    cv::Mat regen_f, raw_f;
    regenerated.convertTo(regen_f, CV_32FC3);
    raw.convertTo(raw_f, CV_32FC3);

    cv::Mat inverse;
    cv::subtract(cv::Scalar::all(1.0), feather_3c_, inverse);

    // feather * regenerated + (1 - feather) * raw
    cv::Mat blended = feather_3c_.mul(regen_f) + inverse.mul(raw_f);

    cv::Mat target = frame(bounds);
    blended.convertTo(target, target.type());
}

}  // namespace vwt
