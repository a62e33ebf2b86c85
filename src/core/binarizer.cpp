/**
 * @file    binarizer.cpp
 * @brief   Grayscale conversion and global thresholding
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/binarizer.hpp"
#include "utils/formatters.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace smt {

namespace {

// Bring any supported depth to 8-bit, keeping the channel count
cv::Mat to_8bit(const cv::Mat& image) {
    cv::Mat out;
    switch (image.depth()) {
        case CV_8U:
            return image;
        case CV_16U:
            image.convertTo(out, CV_8U, 1.0 / 257.0);
            return out;
        case CV_8S:
        case CV_16S:
        case CV_32S:
            // Integer samples are taken as 0-255 values, saturated
            image.convertTo(out, CV_8U);
            return out;
        case CV_32F:
        case CV_64F: {
            // Normalized float when nothing exceeds 1.0, else 0-255 values
            double max_val = 0.0;
            cv::minMaxLoc(image.reshape(1), nullptr, &max_val);
            image.convertTo(out, CV_8U, (max_val <= 1.0) ? 255.0 : 1.0);
            return out;
        }
        default:
            throw std::invalid_argument(
                fmt::format("Unsupported pixel depth {}", image.depth()));
    }
}

}  // anonymous namespace

cv::Mat1b to_grayscale(const cv::Mat& image, ChannelOrder order) {
    if (image.empty()) {
        throw InvalidShapeError("Empty image provided");
    }
    if (image.dims != 2) {
        throw InvalidShapeError(
            fmt::format("Expected a 2-D image, got {} dimensions", image.dims));
    }

    const cv::Mat image_8u = to_8bit(image);
    const bool rgb = (order == ChannelOrder::RGB);

    cv::Mat1b gray;
    switch (image_8u.channels()) {
        case 1:
            gray = image_8u;
            break;
        case 3:
            cv::cvtColor(image_8u, gray, rgb ? cv::COLOR_RGB2GRAY : cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image_8u, gray, rgb ? cv::COLOR_RGBA2GRAY : cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw InvalidShapeError(
                fmt::format("Unsupported channel count {} (expected 1, 3 or 4)",
                            image_8u.channels()));
    }
    return gray;
}

OtsuThreshold compute_otsu_threshold(const cv::Mat1b& gray) {
    double min_val, max_val;
    cv::minMaxLoc(gray, &min_val, &max_val);

    if (min_val == max_val) {
        spdlog::warn("Constant-intensity image ({:.0f}), Otsu threshold is degenerate", min_val);
        return {min_val, true};
    }

    cv::Mat1b scratch;
    return {cv::threshold(gray, scratch, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU), false};
}

BinarizeResult binarize(const cv::Mat& image, const BinarizeOptions& options) {
    const cv::Mat1b gray = to_grayscale(image, options.channel_order);

    BinarizeResult result{};
    if (options.threshold) {
        result.threshold = *options.threshold;
    } else {
        const OtsuThreshold otsu = compute_otsu_threshold(gray);
        result.threshold = otsu.value;
        result.degenerate = otsu.degenerate;
    }

    cv::threshold(gray, result.mask, result.threshold, 255, cv::THRESH_BINARY);

    spdlog::debug("Binarized {} image ({}): threshold={:.2f}{}, {} foreground px",
                  gray.size(), to_string(options.channel_order), result.threshold,
                  options.threshold ? " (fixed)" : " (otsu)",
                  cv::countNonZero(result.mask));

    return result;
}

BinaryMask binarize_image(const cv::Mat& image, const BinarizeOptions& options) {
    return binarize(image, options).mask;
}

}  // namespace smt
