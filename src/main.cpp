/**
 * @file    main.cpp
 * @brief   Video Watermark Tool - CLI Entry Point
 * @license MIT
 *
 * @details
 * Removes a fixed on-screen watermark from every frame of a batch of videos.
 *
 * Mechanism:
 *   The watermark footprint is voted out of a few sampled frames once, then
 *   only that footprint is regenerated frame by frame. Frames whose
 *   watermark region did not change reuse the last result, and visually
 *   identical regions are served from a perceptual cache.
 *
 * Usage:
 *   VideoWatermarkTool -i videos/ -o output/ -r 1600,900,280,120
 *   VideoWatermarkTool -i clip.mp4 -r 1600,900,280,120 -p preview.png
 *   VideoWatermarkTool --config batch.ini
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return vwt::cli::run(argc, argv);
}
