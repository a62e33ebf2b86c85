/**
 * @file    binarizer.hpp
 * @brief   Grayscale conversion and global thresholding
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Input images may be 1, 3 or 4 channel. Depths:
 *   - 8-bit, signed integer : 0-255 values, saturated
 *   - 16-bit                : 0-65535, scaled down
 *   - float                 : normalized 0.0-1.0 when the maximum is <= 1.0,
 *                             otherwise 0-255 values
 * Everything is reduced to 8-bit luminance before thresholding, so explicit
 * thresholds are always on the 0-255 scale.
 */

#pragma once

#include "core/options.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

namespace smt {

/**
 * Binarization output
 */
struct BinarizeResult {
    BinaryMask mask;        // 255 where luminance > threshold
    double threshold;       // Threshold actually applied (0-255)
    bool degenerate;        // Constant-intensity input, Otsu is arbitrary
};

/**
 * Otsu estimate
 */
struct OtsuThreshold {
    double value;           // 0-255
    bool degenerate;        // Constant-intensity input
};

/**
 * Convert an image to 8-bit luminance
 *
 * @param image  Input image (1, 3 or 4 channels)
 * @param order  Channel order of multi-channel input
 * @return       CV_8UC1 grayscale image
 * @throws InvalidShapeError     empty, not 2-D, or unsupported channel count
 * @throws std::invalid_argument unsupported pixel depth
 */
[[nodiscard]] cv::Mat1b to_grayscale(const cv::Mat& image, ChannelOrder order);

/**
 * Global Otsu threshold of a grayscale image
 *
 * A constant image has no between-class variance. The constant value is
 * returned and a warning is logged.
 */
[[nodiscard]] OtsuThreshold compute_otsu_threshold(const cv::Mat1b& gray);

/**
 * Threshold an image into a foreground mask
 *
 * @param image    Input image
 * @param options  Threshold (Otsu when unset) and channel order
 * @return         Mask plus the threshold that produced it
 */
[[nodiscard]] BinarizeResult binarize(const cv::Mat& image, const BinarizeOptions& options = {});

// Convenience wrapper returning only the mask
[[nodiscard]] BinaryMask binarize_image(const cv::Mat& image, const BinarizeOptions& options = {});

}  // namespace smt
