/**
 * @file    options.cpp
 * @brief   Option validation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/options.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace smt {

namespace {

void require_positive(int value, std::string_view name) {
    if (value < 1) {
        throw std::invalid_argument(
            fmt::format("{} must be >= 1 (got {})", name, value));
    }
}

}  // anonymous namespace

void validate(const LineDetectionOptions& options) {
    if (options.rho <= 0.0) {
        throw std::invalid_argument(
            fmt::format("rho must be > 0 (got {})", options.rho));
    }
    if (options.theta_degrees <= 0.0 || options.theta_degrees > 180.0) {
        throw std::invalid_argument(
            fmt::format("theta_degrees must be in (0, 180] (got {})", options.theta_degrees));
    }
    require_positive(options.vote_threshold, "vote_threshold");
    require_positive(options.min_length_divisor, "min_length_divisor");
    if (options.max_line_gap < 0) {
        throw std::invalid_argument(
            fmt::format("max_line_gap must be >= 0 (got {})", options.max_line_gap));
    }
    require_positive(options.sample_divisions, "sample_divisions");
    require_positive(options.line_thickness, "line_thickness");
    require_positive(options.axis_open_iterations, "axis_open_iterations");
}

void validate(const SeedOptions& options) {
    if (options.border_fraction < 0.0 || options.border_fraction >= 0.5) {
        throw std::invalid_argument(
            fmt::format("border_fraction must be in [0, 0.5) (got {})", options.border_fraction));
    }
}

void validate(const SegmentationOptions& options) {
    if (options.binarize.threshold) {
        const double t = *options.binarize.threshold;
        if (t < 0.0 || t > 255.0) {
            throw std::invalid_argument(
                fmt::format("threshold must be in [0, 255] (got {})", t));
        }
    }
    require_positive(options.structure_kernel_size, "structure_kernel_size");
    require_positive(options.depiction_size_divisor, "depiction_size_divisor");
    validate(options.lines);
}

}  // namespace smt
