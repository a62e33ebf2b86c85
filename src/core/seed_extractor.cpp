/**
 * @file    seed_extractor.cpp
 * @brief   Interior seed points for downstream region growing
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The candidate set is built as a dense mask (ink AND region AND NOT
 * exclusion) and scanned with cv::findNonZero over the inner window, so
 * seeds always come out in raster order.
 */

#include "core/seed_extractor.hpp"
#include "core/mask_ops.hpp"
#include "utils/formatters.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

namespace smt {

namespace {

// Guards against 0.1 * n landing a hair above an integer limit
constexpr double kWindowEpsilon = 1e-9;

/**
 * Inner window of a bounding box, inclusive pixel limits
 * rounded inwards. Empty if the trimming leaves nothing.
 */
cv::Rect inner_window(const cv::Rect& bounds, double border_fraction) {
    const double x_min = bounds.x;
    const double x_max = bounds.x + bounds.width - 1;
    const double y_min = bounds.y;
    const double y_max = bounds.y + bounds.height - 1;

    const double x_margin = (x_max - x_min) * border_fraction;
    const double y_margin = (y_max - y_min) * border_fraction;

    const int x_lo = static_cast<int>(std::ceil(x_min + x_margin - kWindowEpsilon));
    const int x_hi = static_cast<int>(std::floor(x_max - x_margin + kWindowEpsilon));
    const int y_lo = static_cast<int>(std::ceil(y_min + y_margin - kWindowEpsilon));
    const int y_hi = static_cast<int>(std::floor(y_max - y_margin + kWindowEpsilon));

    if (x_hi < x_lo || y_hi < y_lo) {
        return {};
    }
    return cv::Rect(x_lo, y_lo, x_hi - x_lo + 1, y_hi - y_lo + 1);
}

}  // anonymous namespace

std::vector<SeedPoint> extract_seeds(
    const cv::Mat& ink_mask,
    const cv::Mat& region_mask,
    const cv::Mat& exclusion_mask,
    const SeedOptions& options)
{
    validate(options);
    require_mask(ink_mask, ink_mask.size(), "ink mask");
    require_mask(region_mask, ink_mask.size(), "region mask");
    require_mask(exclusion_mask, ink_mask.size(), "exclusion mask");

    const BinaryMask region = to_binary_mask(region_mask);
    if (cv::countNonZero(region) == 0) {
        spdlog::debug("Empty region mask, no seeds");
        return {};
    }

    const cv::Rect bounds = cv::boundingRect(region);
    const cv::Rect window = inner_window(bounds, options.border_fraction);
    if (window.empty()) {
        spdlog::debug("Region {} has no inner window, no seeds", bounds);
        return {};
    }

    BinaryMask candidates;
    cv::bitwise_and(to_binary_mask(ink_mask), region, candidates);
    candidates.setTo(cv::Scalar(kMaskOff), to_binary_mask(exclusion_mask));

    std::vector<cv::Point> hits;
    cv::findNonZero(candidates(window), hits);

    std::vector<SeedPoint> seeds;
    seeds.reserve(hits.size());
    for (const auto& p : hits) {
        seeds.emplace_back(p.x + window.x, p.y + window.y);
    }

    spdlog::debug("Seeds: region {} -> window {}, {} seeds", bounds, window, seeds.size());

    return seeds;
}

std::vector<RegionSeeds> extract_region_seeds(
    const cv::Mat& ink_mask,
    const cv::Mat& structure_mask,
    const cv::Mat& exclusion_mask,
    const SeedOptions& options,
    int min_area)
{
    std::vector<RegionSeeds> result;

    for (auto& region : label_regions(structure_mask, min_area)) {
        auto seeds = extract_seeds(ink_mask, region.mask, exclusion_mask, options);
        result.push_back(RegionSeeds{std::move(region), std::move(seeds)});
    }

    return result;
}

}  // namespace smt
