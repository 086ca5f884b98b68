/**
 * @file    types.hpp
 * @brief   Shared type definitions for Video Watermark Tool
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vwt {

// Result type for whole-video operations
enum class [[nodiscard]] ResultCode {
    Success,
    Cancelled
};

// Convert result code to string
[[nodiscard]] constexpr const char* to_string(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::Success:   return "Success";
        case ResultCode::Cancelled: return "Cancelled";
        default:                    return "Unknown";
    }
}

// Pipeline failure kinds; every one aborts the current video
enum class ErrorCode {
    RegionNotSet,                  // Localization invoked before a region exists
    NoWatermarkDetected,           // Voting / bounding box found no pixels
    InvalidFrameData,              // Frame geometry disagrees with the region
    ExternalServiceFailure,        // Regenerator raised or returned bad data
    InternalConsistencyViolation   // Skip with no regenerated snapshot
};

[[nodiscard]] constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::RegionNotSet:                 return "Region not set";
        case ErrorCode::NoWatermarkDetected:          return "No watermark detected";
        case ErrorCode::InvalidFrameData:             return "Invalid frame data";
        case ErrorCode::ExternalServiceFailure:       return "External service failure";
        case ErrorCode::InternalConsistencyViolation: return "Internal consistency violation";
        default:                                      return "Unknown";
    }
}

/**
 * Exception raised by the frame pipeline
 *
 * what() reads "<kind>: <detail>", code() gives the kind for callers that
 * branch on it.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail)
        , code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace vwt
