/**
 * @file    skip_detector.hpp
 * @brief   Temporal skip decision for the watermark region
 * @license MIT
 *
 * @details
 * A frame must be reprocessed when
 *   - its index is a multiple of the keyframe interval, or
 *   - its region differs from the reference region by more than the
 *     scene change threshold (mean squared grayscale difference).
 *
 * The reference is replaced only when a frame is actually reprocessed, so
 * it holds the region as of the last regeneration, not the previous frame.
 * Small per-frame changes therefore accumulate until they cross the
 * threshold.
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>

namespace vwt {

struct SkipConfig {
    int keyframe_interval{5};
    double scene_change_threshold{50.0};
};

class TemporalSkipDetector {
public:
    explicit TemporalSkipDetector(const SkipConfig& config = {});

    /**
     * Decide whether the frame's region must be regenerated
     *
     * @param frame_index  Zero-based index in the stream
     * @param region       Raw region pixels of that frame
     * @return             true to reprocess, false to reuse the last result
     */
    [[nodiscard]] bool decide(std::int64_t frame_index, const cv::Mat& region) const;

    // Call only for frames that were reprocessed
    void update_reference(const cv::Mat& region);

    [[nodiscard]] bool has_reference() const noexcept { return !reference_.empty(); }
    [[nodiscard]] const SkipConfig& config() const noexcept { return config_; }

    /**
     * Mean squared grayscale difference between two regions
     *
     * Returns +infinity when either side is empty, which forces a reprocess.
     */
    [[nodiscard]] static double frame_difference(const cv::Mat& a, const cv::Mat& b);

private:
    SkipConfig config_;
    cv::Mat reference_;
};

}  // namespace vwt
