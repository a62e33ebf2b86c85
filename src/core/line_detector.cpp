/**
 * @file    line_detector.cpp
 * @brief   Noise line detection implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Chemical bond strokes are rarely perfectly axis-aligned runs spanning a
 * tenth of the page; table borders and rules are. Long slanted strokes
 * (arrows, underlines) are left to the Hough stage, which spares any
 * segment passing through the structure mask.
 */

#include "core/line_detector.hpp"
#include "core/mask_ops.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace smt {

DepictionSize estimate_depiction_size(cv::Size image_size, int divisor) {
    if (divisor < 1) {
        throw std::invalid_argument("Depiction size divisor must be >= 1");
    }
    return DepictionSize{
        .max_height = std::max(1, image_size.height / divisor),
        .max_width = std::max(1, image_size.width / divisor)
    };
}

std::vector<cv::Point2d> find_equidistant_points(cv::Point p1, cv::Point p2, int divisions) {
    if (divisions < 1) {
        throw std::invalid_argument("Point divisions must be >= 1");
    }

    std::vector<cv::Point2d> points;
    points.reserve(static_cast<size_t>(divisions) + 1);

    for (int i = 0; i <= divisions; ++i) {
        const double t = static_cast<double>(i) / divisions;
        points.emplace_back(
            p1.x * (1.0 - t) + p2.x * t,
            p1.y * (1.0 - t) + p2.y * t
        );
    }
    return points;
}

// =============================================================================
// Axis-aligned detector
// =============================================================================

BinaryMask detect_axis_aligned_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const LineDetectionOptions& options)
{
    const BinaryMask foreground = to_binary_mask(binary);

    const int kernel_width = std::max(1, depiction_size.max_width);
    const int kernel_height = std::max(1, depiction_size.max_height);
    const int iterations = std::max(1, options.axis_open_iterations);

    const cv::Mat horizontal_kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(kernel_width, 1));
    const cv::Mat vertical_kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(1, kernel_height));

    BinaryMask horizontal_mask;
    BinaryMask vertical_mask;
    cv::morphologyEx(foreground, horizontal_mask, cv::MORPH_OPEN, horizontal_kernel,
                     cv::Point(-1, -1), iterations);
    cv::morphologyEx(foreground, vertical_mask, cv::MORPH_OPEN, vertical_kernel,
                     cv::Point(-1, -1), iterations);

    BinaryMask exclusion_mask;
    cv::bitwise_or(horizontal_mask, vertical_mask, exclusion_mask);

    spdlog::debug("Axis-aligned lines ({}x1 / 1x{}, {} iterations): "
                  "horizontal={} px, vertical={} px",
                  kernel_width, kernel_height, iterations,
                  cv::countNonZero(horizontal_mask), cv::countNonZero(vertical_mask));

    return exclusion_mask;
}

// =============================================================================
// Geometric detector
// =============================================================================

std::vector<LineSegment> find_line_segments(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const LineDetectionOptions& options)
{
    const BinaryMask foreground = to_binary_mask(binary);

    const int longest = std::max(depiction_size.max_height, depiction_size.max_width);
    const double min_length = longest / std::max(1, options.min_length_divisor);
    const double theta = CV_PI / 180.0 * options.theta_degrees;

    std::vector<LineSegment> segments;
    cv::HoughLinesP(foreground, segments,
                    options.rho,
                    theta,
                    options.vote_threshold,
                    min_length,
                    options.max_line_gap);

    spdlog::debug("Hough: {} segments (min length {:.0f}, max gap {})",
                  segments.size(), min_length, options.max_line_gap);

    return segments;
}

bool segment_touches_mask(
    const LineSegment& segment,
    const cv::Mat& candidate_mask,
    int sample_divisions)
{
    const cv::Point p1(segment[0], segment[1]);
    const cv::Point p2(segment[2], segment[3]);
    const auto points = find_equidistant_points(p1, p2, sample_divisions);

    for (size_t i = 1; i + 1 < points.size(); ++i) {
        const int x = static_cast<int>(points[i].x);
        const int y = static_cast<int>(points[i].y);
        if (x < 0 || y < 0 || x >= candidate_mask.cols || y >= candidate_mask.rows) {
            continue;
        }
        if (candidate_mask.at<uchar>(y, x) != 0) {
            return true;
        }
    }
    return false;
}

LineDetectionResult classify_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const cv::Mat& candidate_mask,
    const LineDetectionOptions& options)
{
    require_mask(binary, binary.size(), "line detector input");
    require_mask(candidate_mask, binary.size(), "candidate mask");

    LineDetectionResult result;
    result.exclusion_mask = BinaryMask::zeros(binary.size());

    const auto segments = find_line_segments(binary, depiction_size, options);

    for (const auto& segment : segments) {
        if (segment_touches_mask(segment, candidate_mask, options.sample_divisions)) {
            result.structure_segments.push_back(segment);
            continue;
        }

        cv::line(result.exclusion_mask,
                 cv::Point(segment[0], segment[1]),
                 cv::Point(segment[2], segment[3]),
                 cv::Scalar(kMaskOn),
                 options.line_thickness,
                 cv::LINE_8);
        result.noise_segments.push_back(segment);
    }

    spdlog::debug("Geometric lines: {} noise, {} inside structures",
                  result.noise_segments.size(), result.structure_segments.size());

    return result;
}

BinaryMask detect_geometric_lines(
    const cv::Mat& binary,
    DepictionSize depiction_size,
    const cv::Mat& candidate_mask,
    const LineDetectionOptions& options)
{
    return classify_lines(binary, depiction_size, candidate_mask, options).exclusion_mask;
}

}  // namespace smt
