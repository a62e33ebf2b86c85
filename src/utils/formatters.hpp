/**
 * @file    formatters.hpp
 * @brief   Custom fmt formatters for paths and OpenCV geometry
 * @author  AllenK (Kwyshell)
 * @date    2026.01.26
 * @license MIT
 *
 * @details
 * Lets spdlog/fmt format the types the pipeline logs most.
 *
 * Paths:
 *   - Windows: path.string() returns ANSI (local codepage), fmt expects UTF-8
 *   - Use path.u8string() which always returns UTF-8
 *   - C++20: u8string() returns std::u8string (char8_t) - needs reinterpret_cast
 *
 * Geometry:
 *   - cv::Size  -> "WxH"
 *   - cv::Rect  -> "WxH+X+Y"
 *
 * Usage:
 *   #include "utils/formatters.hpp"
 *   spdlog::info("Processing: {} ({})", some_path, image.size());
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <opencv2/core/types.hpp>

namespace smt {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * This handles the C++20 char8_t issue where u8string() returns std::u8string
 * instead of std::string.
 *
 * @param path  The filesystem path to convert
 * @return      UTF-8 encoded string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

}  // namespace smt

// =============================================================================
// fmt formatter specializations
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

template <>
struct fmt::formatter<cv::Size> : fmt::formatter<std::string_view> {
    auto format(const cv::Size& s, format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(
            fmt::format("{}x{}", s.width, s.height), ctx);
    }
};

template <>
struct fmt::formatter<cv::Rect> : fmt::formatter<std::string_view> {
    auto format(const cv::Rect& r, format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(
            fmt::format("{}x{}+{}+{}", r.width, r.height, r.x, r.y), ctx);
    }
};
