/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @license MIT
 *
 * @details
 * C++20 path::u8string() returns std::u8string (char8_t), which neither
 * fmt nor spdlog accept. These helpers bridge it to plain UTF-8 std::string.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Processing: {}", some_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace vwt {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

// Output video path for an input video: <output_dir>/<stem>.mp4
inline std::filesystem::path output_video_path(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir)
{
    auto out = output_dir / input.stem();
    out += ".mp4";
    return out;
}

}  // namespace vwt

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
