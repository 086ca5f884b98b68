/**
 * @file    pipeline.cpp
 * @brief   Adaptive per-frame pipeline implementation
 * @license MIT
 */

#include "core/pipeline.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <exception>
#include <utility>

namespace vwt {

FramePipeline::FramePipeline(const WatermarkGeometry& geometry,
                             RegionRegenerator& regenerator,
                             const PipelineConfig& config)
    : geometry_(geometry)
    , regenerator_(regenerator)
    , config_(config)
    , compositor_(geometry.region_mask, config.feather_kernel)
{
    if (geometry_.region_mask.size() != geometry_.bounds.size()) {
        throw PipelineError(ErrorCode::InvalidFrameData, "region mask does not match processing bounds");
    }
}

cv::Mat FramePipeline::regenerate(const cv::Mat& region, std::int64_t frame_index) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    cv::Mat output;
    try {
        output = regenerator_.regenerate(region, geometry_.region_mask, config_.regeneration);
    } catch (const std::exception& e) {
        throw PipelineError(ErrorCode::ExternalServiceFailure,
                            fmt::format("frame {}: {}", frame_index, e.what()));
    }

    if (output.empty() || output.size() != region.size() ||
        output.channels() != region.channels()) {
        throw PipelineError(ErrorCode::ExternalServiceFailure, fmt::format(
            "frame {}: regenerator returned {}x{}x{}, expected {}x{}x{}",
            frame_index, output.cols, output.rows, output.channels(),
            region.cols, region.rows, region.channels()));
    }

    cv::Mat normalized = normalize_regenerated(output);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("Frame {}: regenerated {}x{} region in {} ms",
                  frame_index, region.cols, region.rows, duration);

    return normalized;
}

FrameStep FramePipeline::process_frame(ProcessorState state,
                                       const cv::Mat& raw_frame,
                                       std::int64_t frame_index) const {
    if (raw_frame.empty() || raw_frame.size() != geometry_.frame_size ||
        raw_frame.type() != CV_8UC3) {
        throw PipelineError(ErrorCode::InvalidFrameData, fmt::format(
            "frame {} is {}x{} (type {}), expected {}x{} BGR",
            frame_index, raw_frame.cols, raw_frame.rows, raw_frame.type(),
            geometry_.frame_size.width, geometry_.frame_size.height));
    }

    const cv::Mat region = raw_frame(geometry_.bounds);
    FrameDecision decision = FrameDecision::Reused;
    cv::Mat processed;

    if (state.skip.decide(frame_index, region)) {
        if (auto cached = state.cache.get(region)) {
            processed = std::move(*cached);
            decision = FrameDecision::CacheHit;
        } else {
            processed = regenerate(region, frame_index);
            state.cache.put(region, processed);
            decision = FrameDecision::Regenerated;
        }

        state.skip.update_reference(region);
        state.last_regenerated = processed;
    } else {
        if (state.last_regenerated.empty()) {
            throw PipelineError(ErrorCode::InternalConsistencyViolation, fmt::format(
                "frame {} skipped before any frame was regenerated", frame_index));
        }
        processed = state.last_regenerated;
    }

    cv::Mat output = raw_frame.clone();
    compositor_.blend(output, geometry_.bounds, processed, region);

    state.counters.frames++;
    switch (decision) {
        case FrameDecision::Regenerated: state.counters.regenerated++; break;
        case FrameDecision::CacheHit:    state.counters.cache_hits++;  break;
        case FrameDecision::Reused:      state.counters.reused++;      break;
    }

    return FrameStep{std::move(state), std::move(output), decision};
}

// =============================================================================
// Whole-video driver
// =============================================================================

void validate_geometry(const FrameSource& source, const WatermarkGeometry& geometry) {
    if (source.frame_size() != geometry.frame_size) {
        throw PipelineError(ErrorCode::InvalidFrameData, fmt::format(
            "video is {}x{} but the watermark mask was computed for {}x{}",
            source.frame_size().width, source.frame_size().height,
            geometry.frame_size.width, geometry.frame_size.height));
    }
}

VideoReport process_video(FrameSource& source,
                          FrameSink& sink,
                          const WatermarkGeometry& geometry,
                          RegionRegenerator& regenerator,
                          const PipelineConfig& config,
                          const std::atomic<bool>* cancel_flag) {
    auto start_time = std::chrono::high_resolution_clock::now();

    validate_geometry(source, geometry);

    const FramePipeline pipeline(geometry, regenerator, config);
    ProcessorState state = pipeline.initial_state();
    VideoReport report;

    source.rewind();

    // Sink is finalized on failure too
    try {
        cv::Mat frame;
        std::int64_t frame_index = 0;
        while (true) {
            if (cancel_flag && cancel_flag->load(std::memory_order_relaxed)) {
                report.code = ResultCode::Cancelled;
                spdlog::warn("Cancelled after {} frames", frame_index);
                break;
            }

            if (!source.read(frame)) break;

            FrameStep step = pipeline.process_frame(std::move(state), frame, frame_index);
            state = std::move(step.state);
            sink.write(step.frame);
            spdlog::trace("Frame {}: {}", frame_index, to_string(step.decision));

            if ((frame_index + 1) % 100 == 0) {
                spdlog::debug("{} / {} frames ({} regenerated, {} cache hits, {} reused)",
                              frame_index + 1, source.frame_count(),
                              state.counters.regenerated, state.counters.cache_hits,
                              state.counters.reused);
            }
            ++frame_index;
        }
    } catch (...) {
        sink.close();
        throw;
    }

    sink.close();

    report.counters = state.counters;
    report.cache = state.cache.stats();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time);

    spdlog::info("{} frames: {} regenerated, {} cache hits, {} reused; cache {} / {} ({} evictions)",
                 report.counters.frames, report.counters.regenerated,
                 report.counters.cache_hits, report.counters.reused,
                 state.cache.size(), state.cache.capacity(), report.cache.evictions);

    return report;
}

cv::Mat preview_frame(const cv::Mat& frame,
                      const WatermarkGeometry& geometry,
                      RegionRegenerator& regenerator,
                      const PipelineConfig& config) {
    const FramePipeline pipeline(geometry, regenerator, config);
    FrameStep step = pipeline.process_frame(pipeline.initial_state(), frame, 0);
    return step.frame;
}

}  // namespace vwt
