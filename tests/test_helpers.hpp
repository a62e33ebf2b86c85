/**
 * @file    test_helpers.hpp
 * @brief   Synthetic page helpers shared by the unit tests
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace smt::test {

// Pixels set in both masks
inline int count_overlap(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat both;
    cv::bitwise_and(a, b, both);
    return cv::countNonZero(both);
}

// Pixels that differ between two masks
inline int count_difference(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat diff;
    cv::compare(a, b, diff, cv::CMP_NE);
    return cv::countNonZero(diff);
}

inline BinaryMask blank_mask(int rows, int cols) {
    return BinaryMask::zeros(rows, cols);
}

inline BinaryMask filled_rect_mask(int rows, int cols, const cv::Rect& rect) {
    BinaryMask mask = blank_mask(rows, cols);
    mask(rect).setTo(cv::Scalar(kMaskOn));
    return mask;
}

inline BinaryMask line_mask(int rows, int cols, cv::Point p1, cv::Point p2, int thickness = 1) {
    BinaryMask mask = blank_mask(rows, cols);
    cv::line(mask, p1, p2, cv::Scalar(kMaskOn), thickness, cv::LINE_8);
    return mask;
}

}  // namespace smt::test
