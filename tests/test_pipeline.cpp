/**
 * test_pipeline.cpp - Tests for the per-frame pipeline and the video driver
 */
#undef NDEBUG
#include <cassert>

#include "core/pipeline.hpp"
#include "core/region_voter.hpp"
#include "core/types.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace vwt;
using vwt::test::MemoryFrameSink;
using vwt::test::MemoryFrameSource;
using vwt::test::ScriptedRegenerator;
using vwt::test::noise_image;
using vwt::test::same_pixels;
using vwt::test::solid_image;

namespace {

const cv::Size kFrame(160, 120);
const cv::Rect kWatermark(40, 20, 40, 40);
const cv::Point kCenter(60, 40);

WatermarkGeometry make_test_geometry() {
    cv::Mat mask = cv::Mat::zeros(kFrame, CV_8UC1);
    mask(kWatermark).setTo(255);
    return make_geometry(mask, 10);
}

template <typename Fn>
ErrorCode expect_pipeline_error(Fn&& fn) {
    try {
        fn();
    } catch (const PipelineError& e) {
        return e.code();
    }
    assert(false && "expected PipelineError");
    return ErrorCode::InternalConsistencyViolation;
}

// Runs frames through a pipeline and records the decisions
std::vector<FrameDecision> run_frames(const FramePipeline& pipeline,
                                      const std::vector<cv::Mat>& frames) {
    std::vector<FrameDecision> decisions;
    ProcessorState state = pipeline.initial_state();
    for (std::size_t i = 0; i < frames.size(); ++i) {
        FrameStep step = pipeline.process_frame(std::move(state), frames[i],
                                                static_cast<std::int64_t>(i));
        state = std::move(step.state);
        decisions.push_back(step.decision);
    }
    return decisions;
}

void test_static_video() {
    const WatermarkGeometry geometry = make_test_geometry();
    assert(geometry.bounds == cv::Rect(30, 10, 60, 60));

    const cv::Mat frame = noise_image(kFrame, 7);
    MemoryFrameSource source(std::vector<cv::Mat>(10, frame));
    MemoryFrameSink sink;
    ScriptedRegenerator regenerator;

    const VideoReport report = process_video(source, sink, geometry, regenerator, PipelineConfig{});

    assert(report.code == ResultCode::Success);
    assert(regenerator.calls == 1);
    assert(report.counters.frames == 10);
    assert(report.counters.regenerated == 1);
    assert(report.counters.cache_hits == 1);
    assert(report.counters.reused == 8);
    assert(sink.closed);
    assert(sink.frames.size() == 10);

    for (const auto& out : sink.frames) {
        const cv::Vec3b center = out.at<cv::Vec3b>(kCenter);
        assert(center[0] <= 1 && center[1] >= 254 && center[2] <= 1);
        assert(out.at<cv::Vec3b>(0, 0) == frame.at<cv::Vec3b>(0, 0));
        assert(out.at<cv::Vec3b>(119, 159) == frame.at<cv::Vec3b>(119, 159));
        assert(same_pixels(out.rowRange(80, 120), frame.rowRange(80, 120)));
    }
    std::cout << "[PASS] Static video: 1 regeneration, 1 cache hit, 8 reuses" << std::endl;
}

void test_decision_sequence() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    const FramePipeline pipeline(geometry, regenerator, PipelineConfig{});

    // A, B x 9, A again at the keyframe
    std::vector<cv::Mat> frames;
    frames.push_back(noise_image(kFrame, 100));
    for (int i = 0; i < 9; ++i) frames.push_back(noise_image(kFrame, 200));
    frames.push_back(noise_image(kFrame, 100));

    const auto decisions = run_frames(pipeline, frames);
    assert(decisions[0] == FrameDecision::Regenerated);
    assert(decisions[1] == FrameDecision::Regenerated);   // scene change
    for (int i : {2, 3, 4, 6, 7, 8, 9}) {
        assert(decisions[i] == FrameDecision::Reused);
    }
    assert(decisions[5] == FrameDecision::CacheHit);
    assert(decisions[10] == FrameDecision::CacheHit);
    assert(regenerator.calls == 2);
    std::cout << "[PASS] Scene change regenerates, revisited content hits the cache" << std::endl;
}

void test_reference_drift() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    PipelineConfig config;
    config.skip.keyframe_interval = 100;
    const FramePipeline pipeline(geometry, regenerator, config);

    const std::vector<cv::Mat> frames{
        solid_image(kFrame, 100), solid_image(kFrame, 105), solid_image(kFrame, 110)};
    const auto decisions = run_frames(pipeline, frames);

    assert(decisions[0] == FrameDecision::Regenerated);
    assert(decisions[1] == FrameDecision::Reused);
    assert(decisions[2] != FrameDecision::Reused);
    std::cout << "[PASS] Gradual change accumulates against the last reference" << std::endl;
}

void test_input_frame_untouched() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    regenerator.behavior = [](const cv::Mat& region, const cv::Mat&) {
        return cv::Mat(region.size(), CV_32FC3, cv::Scalar::all(1.0));
    };
    const FramePipeline pipeline(geometry, regenerator, PipelineConfig{});

    const cv::Mat frame = noise_image(kFrame, 8);
    const cv::Mat before = frame.clone();
    FrameStep step = pipeline.process_frame(pipeline.initial_state(), frame, 0);

    assert(same_pixels(frame, before));
    const cv::Vec3b center = step.frame.at<cv::Vec3b>(kCenter);
    assert(center[0] >= 254 && center[1] >= 254 && center[2] >= 254);
    assert(step.state.counters.regenerated == 1);
    std::cout << "[PASS] Float [0,1] output is scaled, input frame is not modified" << std::endl;
}

void test_frame_errors() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    const FramePipeline pipeline(geometry, regenerator, PipelineConfig{});

    assert(expect_pipeline_error([&] {
        (void)pipeline.process_frame(pipeline.initial_state(), noise_image(cv::Size(100, 100), 1), 0);
    }) == ErrorCode::InvalidFrameData);

    MemoryFrameSource wrong_size(std::vector<cv::Mat>(3, noise_image(cv::Size(100, 100), 1)));
    assert(expect_pipeline_error([&] { validate_geometry(wrong_size, geometry); })
           == ErrorCode::InvalidFrameData);

    assert(expect_pipeline_error([&] {
        (void)pipeline.process_frame(pipeline.initial_state(), noise_image(kFrame, 2), 1);
    }) == ErrorCode::InternalConsistencyViolation);
    std::cout << "[PASS] InvalidFrameData, InternalConsistencyViolation" << std::endl;
}

void test_regenerator_failures() {
    const WatermarkGeometry geometry = make_test_geometry();

    ScriptedRegenerator throwing;
    throwing.behavior = [](const cv::Mat&, const cv::Mat&) -> cv::Mat {
        throw std::runtime_error("model unavailable");
    };
    const FramePipeline failing(geometry, throwing, PipelineConfig{});
    assert(expect_pipeline_error([&] {
        (void)failing.process_frame(failing.initial_state(), noise_image(kFrame, 3), 0);
    }) == ErrorCode::ExternalServiceFailure);

    ScriptedRegenerator wrong_size;
    wrong_size.behavior = [](const cv::Mat&, const cv::Mat&) {
        return cv::Mat(5, 5, CV_8UC3, cv::Scalar::all(0));
    };
    const FramePipeline malformed(geometry, wrong_size, PipelineConfig{});
    assert(expect_pipeline_error([&] {
        (void)malformed.process_frame(malformed.initial_state(), noise_image(kFrame, 4), 0);
    }) == ErrorCode::ExternalServiceFailure);

    // A failure aborts the video
    MemoryFrameSource source(std::vector<cv::Mat>(4, noise_image(kFrame, 5)));
    MemoryFrameSink sink;
    assert(expect_pipeline_error([&] {
        (void)process_video(source, sink, geometry, throwing, PipelineConfig{});
    }) == ErrorCode::ExternalServiceFailure);
    assert(sink.frames.empty());
    std::cout << "[PASS] Regenerator errors surface as ExternalServiceFailure" << std::endl;
}

void test_failure_closes_sink() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    regenerator.behavior = [&regenerator](const cv::Mat& region, const cv::Mat&) {
        if (regenerator.calls > 1) throw std::runtime_error("model crashed");
        return cv::Mat(region.size(), region.type(), cv::Scalar(0, 255, 0));
    };

    // Second frame is a scene change, so it reaches the regenerator
    MemoryFrameSource source(std::vector<cv::Mat>{noise_image(kFrame, 10), noise_image(kFrame, 11)});
    MemoryFrameSink sink;
    assert(expect_pipeline_error([&] {
        (void)process_video(source, sink, geometry, regenerator, PipelineConfig{});
    }) == ErrorCode::ExternalServiceFailure);
    assert(sink.frames.size() == 1);
    assert(sink.closed);
    std::cout << "[PASS] Sink is closed when a frame fails mid-stream" << std::endl;
}

void test_cancellation() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    MemoryFrameSource source(std::vector<cv::Mat>(10, noise_image(kFrame, 6)));
    MemoryFrameSink sink;
    std::atomic<bool> cancel{true};

    const VideoReport report = process_video(source, sink, geometry, regenerator,
                                             PipelineConfig{}, &cancel);
    assert(report.code == ResultCode::Cancelled);
    assert(report.counters.frames == 0);
    assert(sink.frames.empty());
    assert(sink.closed);
    assert(regenerator.calls == 0);
    std::cout << "[PASS] Cancel flag stops before the next frame" << std::endl;
}

void test_preview() {
    const WatermarkGeometry geometry = make_test_geometry();
    ScriptedRegenerator regenerator;
    const cv::Mat frame = noise_image(kFrame, 9);

    const cv::Mat preview = preview_frame(frame, geometry, regenerator, PipelineConfig{});
    assert(preview.size() == kFrame);
    assert(preview.at<cv::Vec3b>(kCenter)[1] >= 254);
    assert(regenerator.calls == 1);
    std::cout << "[PASS] Preview runs one frame through a fresh pipeline" << std::endl;
}

}  // namespace

int main() {
    std::cout << "FramePipeline Tests" << std::endl;

    test_static_video();
    test_decision_sequence();
    test_reference_drift();
    test_input_frame_untouched();
    test_frame_errors();
    test_regenerator_failures();
    test_failure_closes_sink();
    test_cancellation();
    test_preview();

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
