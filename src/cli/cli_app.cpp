/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Batch driver for Video Watermark Tool.
 *   - Enumerates the videos of the input directory
 *   - Localizes the watermark once, on the first video
 *   - Processes every video with that geometry
 *
 * All videos of one batch must share the first video's frame size.
 */

#include "cli/cli_app.hpp"
#include "core/pipeline.hpp"
#include "core/region_provider.hpp"
#include "core/region_voter.hpp"
#include "core/regenerator.hpp"
#include "core/video_io.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace vwt::cli {

namespace {

std::atomic<bool> g_cancel_requested{false};

void on_signal(int /*signal*/) {
    g_cancel_requested.store(true);
}

// =============================================================================
// Banner and reports
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  Video Watermark Tool\n");
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", APP_VERSION);
    fmt::print("\n");
}

std::string format_duration(std::chrono::milliseconds elapsed) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    return fmt::format("{}:{:02d}:{:02d}", total / 3600, (total / 60) % 60, total % 60);
}

void print_video_report(const fs::path& video, const FrameSource& source, const VideoReport& report) {
    fmt::print(fmt::fg(fmt::color::green), "[OK] {}\n", video.filename());
    fmt::print("  Resolution:      {}x{}\n", source.frame_size().width, source.frame_size().height);
    fmt::print("  Duration:        {:.2f} s\n", source.duration());
    fmt::print("  Frame rate:      {:.2f}\n", source.fps());
    fmt::print("  Total frames:    {}\n", static_cast<int>(source.duration() * source.fps()));
    fmt::print("  Regenerated:     {} (cache hits {}, reused {})\n",
               report.counters.regenerated, report.counters.cache_hits, report.counters.reused);
    fmt::print("  Processing time: {}\n", format_duration(report.elapsed));
}

struct BatchResult {
    int success = 0;
    int fail = 0;

    void print() const {
        fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", success);
        if (fail > 0) {
            fmt::print(fmt::fg(fmt::color::red), ", {} failed", fail);
        }
        fmt::print("\n");
    }
};

// =============================================================================
// Processing helpers
// =============================================================================

WatermarkGeometry localize_watermark(const fs::path& video,
                                     RegionProvider& provider,
                                     const PipelineConfig& config) {
    spdlog::info("Localizing watermark on {}", video.filename());

    VideoFileSource source(video);
    RegionVoter voter(config.voter);
    voter.set_region(provider.select(source));

    const cv::Mat mask = voter.localize(source);
    return make_geometry(mask, config.margin);
}

bool write_preview(const fs::path& video,
                   const fs::path& preview_path,
                   const WatermarkGeometry& geometry,
                   RegionRegenerator& regenerator,
                   const PipelineConfig& config) {
    VideoFileSource source(video);
    validate_geometry(source, geometry);

    RegionVoter voter(config.voter);
    const cv::Mat frame = voter.first_valid_frame(source);
    if (frame.empty()) {
        spdlog::error("No frame available for preview in {}", video);
        return false;
    }

    const cv::Mat result = preview_frame(frame, geometry, regenerator, config);
    if (!cv::imwrite(preview_path.string(), result)) {
        spdlog::error("Failed to write preview: {}", preview_path);
        return false;
    }

    fmt::print(fmt::fg(fmt::color::green), "[OK] Preview written: {}\n", preview_path);
    return true;
}

// Remove the truncated output of a failed video
void discard_partial_output(const fs::path& output, bool created) {
    if (!created) return;

    std::error_code ec;
    if (fs::remove(output, ec)) {
        spdlog::info("Removed partial output {}", output);
    } else if (ec) {
        spdlog::warn("Could not remove partial output {}: {}", output, ec.message());
    }
}

bool process_single(const fs::path& video,
                    const fs::path& output_dir,
                    const WatermarkGeometry& geometry,
                    RegionRegenerator& regenerator,
                    const PipelineConfig& config,
                    BatchResult& result) {
    const fs::path output = output_video_path(video, output_dir);
    spdlog::info("Processing: {} -> {}", video.filename(), output);

    bool output_created = false;
    try {
        VideoFileSource source(video);
        validate_geometry(source, geometry);

        VideoFileSink sink(output, source.fps(), source.frame_size());
        output_created = true;
        const VideoReport report = process_video(
            source, sink, geometry, regenerator, config, &g_cancel_requested);

        if (report.code == ResultCode::Cancelled) {
            spdlog::warn("{}: {} by user", video.filename(), to_string(report.code));
            result.fail++;
            return false;
        }

        print_video_report(video, source, report);
        result.success++;
    } catch (const PipelineError& e) {
        spdlog::error("{}: {}", video.filename(), e.what());
        result.fail++;
        discard_partial_output(output, output_created);
    } catch (const std::exception& e) {
        spdlog::error("Error processing {}: {}", video, e.what());
        result.fail++;
        discard_partial_output(output, output_created);
    }
    return true;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

std::vector<fs::path> collect_videos(const fs::path& input) {
    std::vector<fs::path> videos;

    if (fs::is_regular_file(input)) {
        if (is_valid_video_file(input)) videos.push_back(input);
        return videos;
    }

    for (const auto& entry : fs::directory_iterator(input)) {
        if (!entry.is_regular_file()) continue;
        if (is_valid_video_file(entry.path())) {
            videos.push_back(entry.path());
        }
    }
    std::sort(videos.begin(), videos.end());
    return videos;
}

bool ensure_directory_writable(const fs::path& directory) {
    std::error_code ec;
    if (!fs::exists(directory)) {
        if (!fs::create_directories(directory, ec)) {
            spdlog::error("Error creating directory {}: {}", directory, ec.message());
            return false;
        }
        return true;
    }

    const fs::path probe = directory / fmt::format(
        "temp_{}.tmp", std::chrono::steady_clock::now().time_since_epoch().count());
    {
        std::ofstream out(probe);
        if (!out || !(out << "test")) {
            spdlog::error("No write permission in directory {}", directory);
            return false;
        }
    }
    fs::remove(probe, ec);
    return true;
}

int run(int argc, char** argv) {
    CLI::App app{"Video Watermark Tool - Remove a fixed watermark from videos"};
    app.set_version_flag("-V,--version", APP_VERSION);
    app.set_config("--config", "", "Read options from an INI/TOML file");
    app.option_defaults()->always_capture_default();

    // Input/Output paths
    std::string input_path;
    std::string output_path = "output";
    std::string region_text;
    std::string preview_path;

    app.add_option("-i,--input", input_path, "Input video file or directory")
        ->required()
        ->check(CLI::ExistingPath);
    app.add_option("-o,--output", output_path, "Output directory");
    app.add_option("-r,--region", region_text, "Watermark region of interest: x,y,w,h")
        ->required();
    app.add_option("-p,--preview", preview_path,
        "Write the effect on the first valid frame to an image and exit");

    PipelineConfig config;

    // Localization
    app.add_option("--samples", config.voter.num_samples, "Frames sampled for voting")
        ->check(CLI::PositiveNumber);
    app.add_option("--min-votes", config.voter.min_vote_count, "Votes needed to mark a pixel")
        ->check(CLI::PositiveNumber);
    app.add_option("--dilation", config.voter.dilation_size, "Mask dilation kernel size")
        ->check(CLI::PositiveNumber);
    app.add_option("--margin", config.margin, "Margin around the watermark bounding box")
        ->check(CLI::NonNegativeNumber);

    // Frame reuse
    app.add_option("--cache-size", config.cache.capacity, "Perceptual cache capacity")
        ->check(CLI::PositiveNumber);
    app.add_option("--similarity", config.cache.similarity_threshold,
        "Max signature distance for a cache hit")
        ->check(CLI::Range(0, 64));
    app.add_option("--keyframe-interval", config.skip.keyframe_interval,
        "Reprocess at least every N frames")
        ->check(CLI::PositiveNumber);
    app.add_option("--scene-threshold", config.skip.scene_change_threshold,
        "Region MSE that forces reprocessing")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--feather", config.feather_kernel, "Feather blur kernel size (odd)")
        ->check(CLI::PositiveNumber);

    // Regeneration
    std::string strategy_text{to_string(config.regeneration.strategy)};
    const CLI::Validator strategy_name(
        [](std::string& text) -> std::string {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return parse_size_strategy(text) ? std::string{}
                                             : "expected original, as-is, resize or crop";
        },
        "original|as-is|resize|crop");
    app.add_option("--steps", config.regeneration.steps, "Regeneration refinement steps")
        ->check(CLI::PositiveNumber);
    app.add_option("--strategy", strategy_text, "Size handling strategy")
        ->transform(strategy_name);
    app.add_option("--crop-margin", config.regeneration.crop_margin, "Crop strategy margin")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--crop-trigger", config.regeneration.crop_trigger_size,
        "Crop strategy trigger size")
        ->check(CLI::PositiveNumber);
    app.add_option("--resize-limit", config.regeneration.resize_limit,
        "Max working resolution")
        ->check(CLI::PositiveNumber);

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    if (!quiet) print_banner();

    // Configure logging
    auto logger = spdlog::get("vwt");
    if (!logger) {
        logger = spdlog::stdout_color_mt("vwt");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (auto strategy = parse_size_strategy(strategy_text)) {
        config.regeneration.strategy = *strategy;
    }

    if (config.feather_kernel % 2 == 0) {
        spdlog::error("--feather must be odd, got {}", config.feather_kernel);
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        FixedRegionProvider provider(parse_region(region_text));
        InpaintRegenerator regenerator;

        const fs::path input(input_path);
        const fs::path output(output_path);

        const auto videos = collect_videos(input);
        if (videos.empty()) {
            spdlog::error("No valid video files found in {}", input);
            return 1;
        }
        spdlog::info("Found {} video(s) in {}", videos.size(), input);

        // Geometry of the first video is reused for the whole batch
        const WatermarkGeometry geometry = localize_watermark(videos.front(), provider, config);

        if (!preview_path.empty()) {
            return write_preview(videos.front(), preview_path, geometry, regenerator, config) ? 0 : 1;
        }

        if (!ensure_directory_writable(output)) {
            return 1;
        }

        BatchResult result;
        for (const auto& video : videos) {
            if (!process_single(video, output, geometry, regenerator, config, result)) {
                break;
            }
        }

        result.print();
        return (result.fail > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace vwt::cli
