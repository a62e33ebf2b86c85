/**
 * @file    types.hpp
 * @brief   Shared type definitions for Structure Mask Tool
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace smt {

// Version info, stamped by the build when available
#ifdef SMT_VERSION
inline constexpr const char* kVersion = SMT_VERSION;
#else
inline constexpr const char* kVersion = "0.3.0";
#endif

// =============================================================================
// Pixel-space primitives
// =============================================================================

// Boolean mask, CV_8UC1. 255 = true, 0 = false.
using BinaryMask = cv::Mat1b;

// (x1, y1, x2, y2) in pixel space
using LineSegment = cv::Vec4i;

// (x, y) interior sample for downstream region growing
using SeedPoint = cv::Point;

inline constexpr std::uint8_t kMaskOn = 255;
inline constexpr std::uint8_t kMaskOff = 0;

/**
 * Rough upper bound of a single depiction on the page.
 * Used to size the line detector kernels and the minimum segment length.
 */
struct DepictionSize {
    int max_height;
    int max_width;
};

// =============================================================================
// Errors
// =============================================================================

/**
 * Image or mask has an unexpected rank, channel count or size.
 * Never recovered inside the core.
 */
class InvalidShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Result type for file operations
enum class [[nodiscard]] ResultCode {
    Success,
    FileNotFound,
    InvalidFormat,
    ProcessingFailed,
    SaveFailed
};

// Convert result code to string
[[nodiscard]] constexpr const char* to_string(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::Success:          return "Success";
        case ResultCode::FileNotFound:     return "File not found";
        case ResultCode::InvalidFormat:    return "Invalid format";
        case ResultCode::ProcessingFailed: return "Processing failed";
        case ResultCode::SaveFailed:       return "Save failed";
        default:                           return "Unknown";
    }
}

}  // namespace smt
