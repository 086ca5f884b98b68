/**
 * @file    pipeline.hpp
 * @brief   Adaptive per-frame watermark removal pipeline
 * @license MIT
 *
 * @details
 * Per frame:
 *   1. Extract the region inside the processing bounds
 *   2. Skip decision (keyframe interval / scene change)
 *   3. Must process: cache lookup, on miss regenerate + cache insert,
 *      then refresh the skip reference and the last regenerated snapshot
 *   4. Otherwise reuse the last regenerated snapshot
 *   5. Feathered composite into a copy of the frame
 *
 * Frame N's decisions depend on frame N-1's outcome, so a video is a fold
 * of process_frame over its frames with one ProcessorState threaded through.
 * The state is moved in and handed back, never shared.
 */

#pragma once

#include "core/compositor.hpp"
#include "core/frame_cache.hpp"
#include "core/region_voter.hpp"
#include "core/regenerator.hpp"
#include "core/skip_detector.hpp"
#include "core/types.hpp"
#include "core/video_io.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vwt {

/**
 * All tunables of a run
 */
struct PipelineConfig {
    VoterConfig voter;
    CacheConfig cache;
    SkipConfig skip;
    RegenerationConfig regeneration;
    int margin{50};                         // Bounding box margin around the mask
    int feather_kernel{kDefaultFeatherKernel};
};

/**
 * What happened to one frame's region
 */
enum class FrameDecision {
    Regenerated,   // Regenerator invoked
    CacheHit,      // Reprocessed from the perceptual cache
    Reused         // Skipped, last regenerated snapshot reused
};

[[nodiscard]] constexpr std::string_view to_string(FrameDecision decision) noexcept {
    switch (decision) {
        case FrameDecision::Regenerated: return "regenerated";
        case FrameDecision::CacheHit:    return "cache-hit";
        case FrameDecision::Reused:      return "reused";
        default:                         return "unknown";
    }
}

struct FrameCounters {
    std::size_t frames{0};
    std::size_t regenerated{0};
    std::size_t cache_hits{0};
    std::size_t reused{0};
};

/**
 * Mutable state of one video run
 */
struct ProcessorState {
    PerceptualFrameCache cache;
    TemporalSkipDetector skip;
    cv::Mat last_regenerated;   // Empty until the first reprocessed frame
    FrameCounters counters;

    explicit ProcessorState(const PipelineConfig& config)
        : cache(config.cache)
        , skip(config.skip) {}
};

/**
 * Outcome of one fold step
 */
struct FrameStep {
    ProcessorState state;
    cv::Mat frame;
    FrameDecision decision;
};

class FramePipeline {
public:
    /**
     * @param geometry     Watermark geometry, must outlive the pipeline
     * @param regenerator  Regeneration service, must outlive the pipeline
     * @param config       Run configuration
     */
    FramePipeline(const WatermarkGeometry& geometry,
                  RegionRegenerator& regenerator,
                  const PipelineConfig& config);

    [[nodiscard]] ProcessorState initial_state() const { return ProcessorState(config_); }

    /**
     * Process one frame
     *
     * @param state        State after the previous frame (moved in)
     * @param raw_frame    BGR 8-bit frame of the geometry's frame size
     * @param frame_index  Zero-based index supplied by the driver
     * @return             Updated state, output frame and decision
     * @throws PipelineError  InvalidFrameData, ExternalServiceFailure,
     *                        InternalConsistencyViolation
     */
    [[nodiscard]] FrameStep process_frame(ProcessorState state,
                                          const cv::Mat& raw_frame,
                                          std::int64_t frame_index) const;

    [[nodiscard]] const WatermarkGeometry& geometry() const noexcept { return geometry_; }

private:
    cv::Mat regenerate(const cv::Mat& region, std::int64_t frame_index) const;

    const WatermarkGeometry& geometry_;
    RegionRegenerator& regenerator_;
    PipelineConfig config_;
    RegionCompositor compositor_;
};

/**
 * Summary of one processed video
 */
struct VideoReport {
    ResultCode code{ResultCode::Success};
    FrameCounters counters;
    CacheStats cache;
    std::chrono::milliseconds elapsed{0};
};

/**
 * Check that a video matches the geometry computed for the batch
 *
 * @throws PipelineError  InvalidFrameData on a frame size mismatch
 */
void validate_geometry(const FrameSource& source, const WatermarkGeometry& geometry);

/**
 * Run the pipeline over a whole video
 *
 * The cancel flag is polled between frames only; every frame handed to the
 * sink is complete. The sink is closed on return and when a frame fails.
 *
 * @return  Report with ResultCode::Success or ResultCode::Cancelled
 * @throws PipelineError  Any pipeline failure aborts the video
 */
VideoReport process_video(FrameSource& source,
                          FrameSink& sink,
                          const WatermarkGeometry& geometry,
                          RegionRegenerator& regenerator,
                          const PipelineConfig& config,
                          const std::atomic<bool>* cancel_flag = nullptr);

/**
 * Run the full pipeline on a single frame (fresh state, frame index 0)
 */
[[nodiscard]] cv::Mat preview_frame(const cv::Mat& frame,
                                    const WatermarkGeometry& geometry,
                                    RegionRegenerator& regenerator,
                                    const PipelineConfig& config);

}  // namespace vwt
