/**
 * @file    region_provider.cpp
 * @brief   Region provider implementation
 * @license MIT
 */

#include "core/region_provider.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <array>
#include <charconv>
#include <stdexcept>
#include <string>

namespace vwt {

cv::Rect FixedRegionProvider::select(FrameSource& source) {
    const cv::Rect frame_rect(cv::Point(0, 0), source.frame_size());
    if ((region_ & frame_rect) != region_) {
        throw PipelineError(ErrorCode::InvalidFrameData, fmt::format(
            "region ({},{} {}x{}) outside {}x{} video",
            region_.x, region_.y, region_.width, region_.height,
            frame_rect.width, frame_rect.height));
    }

    spdlog::info("Region of interest: ({},{}) {}x{}",
                 region_.x, region_.y, region_.width, region_.height);
    return region_;
}

cv::Rect parse_region(std::string_view text) {
    std::array<int, 4> values{};
    std::size_t pos = 0;

    for (std::size_t i = 0; i < values.size(); ++i) {
        const std::size_t end = (i + 1 < values.size()) ? text.find(',', pos) : text.size();
        if (end == std::string_view::npos) {
            throw std::invalid_argument("Region must be x,y,w,h: " + std::string(text));
        }

        const char* first = text.data() + pos;
        const char* last = text.data() + end;
        while (first < last && *first == ' ') ++first;

        auto [ptr, ec] = std::from_chars(first, last, values[i]);
        if (ec != std::errc{} || ptr != last) {
            throw std::invalid_argument("Region must be x,y,w,h: " + std::string(text));
        }
        pos = end + 1;
    }

    const cv::Rect region(values[0], values[1], values[2], values[3]);
    if (region.x < 0 || region.y < 0 || region.width <= 0 || region.height <= 0) {
        throw std::invalid_argument("Region needs non-negative origin and positive size: " + std::string(text));
    }
    return region;
}

}  // namespace vwt
