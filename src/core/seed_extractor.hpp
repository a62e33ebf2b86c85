/**
 * @file    seed_extractor.hpp
 * @brief   Interior seed points for downstream region growing
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/options.hpp"
#include "core/regions.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace smt {

/**
 * Seed pixels of one region of interest
 *
 * A seed is an ink pixel inside the region, within the inner window of the
 * region's bounding box (border_fraction trimmed from every side), and not
 * marked in the exclusion mask.
 *
 * @param ink_mask        Non-background pixels of the page
 * @param region_mask     Region of interest (e.g. one structure component)
 * @param exclusion_mask  Noise lines to skip
 * @param options         Window trimming
 * @return                Seeds in raster order (y, then x); empty for an empty region
 * @throws InvalidShapeError if the masks differ in size or type
 */
[[nodiscard]] std::vector<SeedPoint> extract_seeds(
    const cv::Mat& ink_mask,
    const cv::Mat& region_mask,
    const cv::Mat& exclusion_mask,
    const SeedOptions& options = {}
);

/**
 * Seeds of one labeled structure region
 */
struct RegionSeeds {
    Region region;
    std::vector<SeedPoint> seeds;
};

/**
 * Label the structure mask and extract seeds per component
 *
 * @param min_area  Components smaller than this are ignored
 * @return          One entry per kept component, ordered as label_regions()
 */
[[nodiscard]] std::vector<RegionSeeds> extract_region_seeds(
    const cv::Mat& ink_mask,
    const cv::Mat& structure_mask,
    const cv::Mat& exclusion_mask,
    const SeedOptions& options = {},
    int min_area = 0
);

}  // namespace smt
