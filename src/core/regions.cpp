/**
 * @file    regions.cpp
 * @brief   Connected-component labeling of structure masks
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/regions.hpp"
#include "core/mask_ops.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace smt {

std::vector<Region> label_regions(const cv::Mat& mask, int min_area) {
    const BinaryMask foreground = to_binary_mask(mask);

    cv::Mat labels, stats, centroids;
    const int count = cv::connectedComponentsWithStats(
        foreground, labels, stats, centroids, 4, CV_32S);

    std::vector<Region> regions;

    // Label 0 is the background
    for (int label = 1; label < count; ++label) {
        const int area = stats.at<int>(label, cv::CC_STAT_AREA);
        if (area < min_area) {
            continue;
        }

        Region region{};
        region.area = area;
        region.bounds = cv::Rect(
            stats.at<int>(label, cv::CC_STAT_LEFT),
            stats.at<int>(label, cv::CC_STAT_TOP),
            stats.at<int>(label, cv::CC_STAT_WIDTH),
            stats.at<int>(label, cv::CC_STAT_HEIGHT)
        );
        cv::compare(labels, label, region.mask, cv::CMP_EQ);
        regions.push_back(std::move(region));
    }

    // Label numbering depends on the labeling algorithm; fix the order here
    std::stable_sort(regions.begin(), regions.end(), [](const Region& a, const Region& b) {
        return (a.bounds.y != b.bounds.y) ? a.bounds.y < b.bounds.y
                                          : a.bounds.x < b.bounds.x;
    });
    for (size_t i = 0; i < regions.size(); ++i) {
        regions[i].index = static_cast<int>(i);
    }

    spdlog::debug("Labeled {} regions ({} components, min area {})",
                  regions.size(), count - 1, min_area);

    return regions;
}

}  // namespace smt
