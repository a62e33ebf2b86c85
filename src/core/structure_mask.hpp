/**
 * @file    structure_mask.hpp
 * @brief   Morphological structure-region mask
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

namespace smt {

inline constexpr int kDefaultStructureKernelSize = 5;

/**
 * Open a foreground mask with a square structuring element
 *
 * Erodes then dilates with the same kernel: components smaller than the
 * kernel vanish, larger ink regions keep their bulk shape.
 *
 * @param binary       Foreground mask (CV_8UC1, non-zero = true)
 * @param kernel_size  Side length of the square element
 * @return             Structure mask of the same size
 */
[[nodiscard]] BinaryMask build_structure_mask(
    const cv::Mat& binary,
    int kernel_size = kDefaultStructureKernelSize
);

}  // namespace smt
