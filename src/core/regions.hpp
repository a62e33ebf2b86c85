/**
 * @file    regions.hpp
 * @brief   Connected-component labeling of structure masks
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace smt {

/**
 * One 4-connected component of a mask
 */
struct Region {
    int index;          // 0-based position in the returned list
    cv::Rect bounds;    // Bounding box in page coordinates
    int area;           // Pixel count
    BinaryMask mask;    // Full-page mask of this component only
};

/**
 * Split a mask into its 4-connected components
 *
 * @param mask      Foreground mask (non-zero = true)
 * @param min_area  Components with fewer pixels are dropped
 * @return          Components sorted by the top-left corner of their bounds
 */
[[nodiscard]] std::vector<Region> label_regions(const cv::Mat& mask, int min_area = 0);

}  // namespace smt
