/**
 * @file    mask_ops.hpp
 * @brief   Binary mask helpers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <string_view>

namespace smt {

/**
 * Verify that a mask is non-empty CV_8UC1 of the expected size
 *
 * @param mask      Mask to check
 * @param expected  Required size
 * @param name      Used in the error message
 * @throws InvalidShapeError on mismatch
 */
void require_mask(const cv::Mat& mask, cv::Size expected, std::string_view name);

// Logical NOT (0 <-> 255). Any non-zero input counts as true.
[[nodiscard]] BinaryMask invert_mask(const cv::Mat& mask);

// Logical OR of two masks of identical size
[[nodiscard]] BinaryMask combine_masks(const cv::Mat& a, const cv::Mat& b);

// Normalize any non-zero value to 255
[[nodiscard]] BinaryMask to_binary_mask(const cv::Mat& mask);

}  // namespace smt
