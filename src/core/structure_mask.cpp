/**
 * @file    structure_mask.cpp
 * @brief   Morphological structure-region mask
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/structure_mask.hpp"
#include "core/mask_ops.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace smt {

BinaryMask build_structure_mask(const cv::Mat& binary, int kernel_size) {
    if (kernel_size < 1) {
        throw std::invalid_argument("Structure kernel size must be >= 1");
    }

    const BinaryMask foreground = to_binary_mask(binary);
    const cv::Mat kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(kernel_size, kernel_size));

    BinaryMask eroded;
    BinaryMask structure_mask;
    cv::erode(foreground, eroded, kernel);
    cv::dilate(eroded, structure_mask, kernel);

    spdlog::debug("Structure mask ({}x{} element): {} -> {} px",
                  kernel_size, kernel_size,
                  cv::countNonZero(foreground), cv::countNonZero(structure_mask));

    return structure_mask;
}

}  // namespace smt
