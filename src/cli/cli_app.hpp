/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <vector>

namespace vwt::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

/**
 * Video files of a directory (or the file itself), sorted by name
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_videos(const std::filesystem::path& input);

/**
 * Create the directory if needed and probe that it is writable
 */
[[nodiscard]] bool ensure_directory_writable(const std::filesystem::path& directory);

}  // namespace vwt::cli
