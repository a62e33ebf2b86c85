/**
 * @file    line_detector.hpp
 * @brief   Noise line detection (table borders, rules, arrow shafts)
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Two complementary detectors producing exclusion masks:
 * 1. Axis-aligned - directional morphological opening keeps only long
 *    horizontal/vertical runs
 * 2. Geometric    - probabilistic Hough transform finds straight segments
 *    of any angle, each classified against a candidate structure mask
 *
 * Both take a foreground mask (non-zero = ink) and are independent of each
 * other; combine_masks() ORs their outputs when both are wanted.
 */

#pragma once

#include "core/options.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace smt {

/**
 * Estimate the largest expected depiction from the page size
 *
 * @param image_size  Page size
 * @param divisor     Fraction of the page (10 = one tenth)
 * @return            (rows / divisor, cols / divisor), each at least 1
 */
[[nodiscard]] DepictionSize estimate_depiction_size(cv::Size image_size, int divisor = 10);

/**
 * Points spaced evenly from p1 to p2, both endpoints included
 *
 * @param divisions  Number of intervals; divisions + 1 points are returned
 */
[[nodiscard]] std::vector<cv::Point2d> find_equidistant_points(
    cv::Point p1,
    cv::Point p2,
    int divisions = 5
);

/**
 * Mask long horizontal and vertical foreground runs
 *
 * Opens the mask with a 1 x max_width and a max_height x 1 element,
 * options.axis_open_iterations times each, and ORs the results.
 * With n iterations a run must span n * (len - 1) + 1 pixels to survive.
 *
 * @param binary          Foreground mask (non-zero = ink)
 * @param depiction_size  Sizes the directional elements
 * @param options         Opening iterations
 * @return                Exclusion mask of the same size
 */
[[nodiscard]] BinaryMask detect_axis_aligned_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const LineDetectionOptions& options = {}
);

/**
 * Straight segments found by the probabilistic Hough transform
 */
[[nodiscard]] std::vector<LineSegment> find_line_segments(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const LineDetectionOptions& options = {}
);

/**
 * True if any interior sample of the segment lies inside the candidate mask
 *
 * Samples at t = i / sample_divisions for i = 1 .. sample_divisions - 1;
 * the endpoints themselves are never tested.
 */
[[nodiscard]] bool segment_touches_mask(
    const LineSegment& segment,
    const cv::Mat& candidate_mask,
    int sample_divisions
);

/**
 * Geometric detection result
 */
struct LineDetectionResult {
    BinaryMask exclusion_mask;                   // Rasterized noise segments
    std::vector<LineSegment> noise_segments;     // Added to the mask
    std::vector<LineSegment> structure_segments; // Kept as part of a structure
};

/**
 * Detect and classify arbitrary-angle segments
 *
 * @param binary          Foreground mask (non-zero = ink)
 * @param depiction_size  Drives the minimum segment length
 * @param candidate_mask  Pixels believed to belong to a structure
 * @param options         Line transform parameters
 * @return                Exclusion mask plus the classified segments
 */
[[nodiscard]] LineDetectionResult classify_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const cv::Mat& candidate_mask,
    const LineDetectionOptions& options = {}
);

// Exclusion mask only
[[nodiscard]] BinaryMask detect_geometric_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const cv::Mat& candidate_mask,
    const LineDetectionOptions& options = {}
);

}  // namespace smt
