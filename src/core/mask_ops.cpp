/**
 * @file    mask_ops.cpp
 * @brief   Binary mask helpers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/mask_ops.hpp"
#include "utils/formatters.hpp"

#include <opencv2/core.hpp>
#include <fmt/format.h>

namespace smt {

void require_mask(const cv::Mat& mask, cv::Size expected, std::string_view name) {
    if (mask.empty()) {
        throw InvalidShapeError(fmt::format("{} is empty", name));
    }
    if (mask.dims != 2 || mask.type() != CV_8UC1) {
        throw InvalidShapeError(
            fmt::format("{} must be a 2-D CV_8UC1 mask (got dims={}, channels={})",
                        name, mask.dims, mask.channels()));
    }
    if (mask.size() != expected) {
        throw InvalidShapeError(
            fmt::format("{} is {}, expected {}", name, mask.size(), expected));
    }
}

BinaryMask to_binary_mask(const cv::Mat& mask) {
    require_mask(mask, mask.size(), "mask");
    BinaryMask out;
    cv::compare(mask, 0, out, cv::CMP_NE);
    return out;
}

BinaryMask invert_mask(const cv::Mat& mask) {
    require_mask(mask, mask.size(), "mask");
    BinaryMask out;
    cv::compare(mask, 0, out, cv::CMP_EQ);
    return out;
}

BinaryMask combine_masks(const cv::Mat& a, const cv::Mat& b) {
    require_mask(a, a.size(), "first mask");
    require_mask(b, a.size(), "second mask");
    BinaryMask out;
    cv::bitwise_or(to_binary_mask(a), to_binary_mask(b), out);
    return out;
}

}  // namespace smt
