/**
 * @file    options.hpp
 * @brief   Tunable parameters for the segmentation pipeline
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Every hand-tuned constant of the pipeline lives here with its
 * default value. Call validate() before handing options to the core.
 */

#pragma once

#include <optional>
#include <string_view>

namespace smt {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * Channel order of multi-channel input
 */
enum class ChannelOrder {
    RGB,    // Decoded by most imaging libraries
    BGR     // cv::imread / cv::imdecode
};

[[nodiscard]] constexpr std::string_view to_string(ChannelOrder order) noexcept {
    switch (order) {
        case ChannelOrder::RGB: return "RGB";
        case ChannelOrder::BGR: return "BGR";
        default:                return "Unknown";
    }
}

// =============================================================================
// Option structs
// =============================================================================

/**
 * Grayscale conversion and global thresholding
 */
struct BinarizeOptions {
    std::optional<double> threshold;            // 0-255, nullopt = Otsu
    ChannelOrder channel_order{ChannelOrder::RGB};
};

/**
 * Line transform and morphology parameters shared by both line detectors
 */
struct LineDetectionOptions {
    double rho{1.0};                // Distance resolution (px)
    double theta_degrees{1.0};      // Angular resolution
    int vote_threshold{5};          // Minimum accumulator votes
    int min_length_divisor{4};      // min length = max(depiction) / divisor
    int max_line_gap{10};           // Merge colinear fragments closer than this
    int sample_divisions{7};        // Interior samples at t = i / divisions
    int line_thickness{3};          // Rasterized noise line thickness
    int axis_open_iterations{2};    // Directional opening iterations
};

/**
 * Seed window
 */
struct SeedOptions {
    double border_fraction{0.1};    // Trimmed from each side of the ROI bounds
};

/**
 * Full pipeline configuration
 */
struct SegmentationOptions {
    BinarizeOptions binarize;
    int structure_kernel_size{5};
    int depiction_size_divisor{10};
    LineDetectionOptions lines;
    bool include_axis_aligned_lines{false};
};

/**
 * Check ranges, throw std::invalid_argument on the first violation
 */
void validate(const LineDetectionOptions& options);
void validate(const SeedOptions& options);
void validate(const SegmentationOptions& options);

}  // namespace smt
