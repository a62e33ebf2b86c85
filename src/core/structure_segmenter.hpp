/**
 * @file    structure_segmenter.hpp
 * @brief   End-to-end structure / noise-line segmentation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Pipeline:
 *   image -> binarize -> ink = NOT paper -> open(ink)       = structure mask
 *   ink + structure mask -> geometric line detector         = exclusion mask
 *   (optionally OR the axis-aligned line detector)
 *
 * Everything is recomputed per image; a segmenter holds nothing but its
 * options and can be shared across threads.
 */

#pragma once

#include "core/options.hpp"
#include "core/seed_extractor.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <string>
#include <utility>

namespace smt {

/**
 * Segmentation output, all masks share the input's size
 */
struct SegmentationResult {
    BinaryMask structure_mask;      // Chemical structure regions
    BinaryMask exclusion_mask;      // Noise lines to disregard
    BinaryMask ink_mask;            // Every non-background pixel

    // Debug info
    DepictionSize depiction_size;   // Size estimate fed to the line detectors
    double threshold;               // Binarization threshold (0-255)
};

/**
 * Main segmentation class
 */
class StructureSegmenter {
public:
    /**
     * @param options  Pipeline parameters
     * @throws std::invalid_argument if options fail validate()
     */
    explicit StructureSegmenter(const SegmentationOptions& options = {});

    /**
     * Segment a decoded page image
     *
     * @param image  2-D image, 1/3/4 channels, integer or float samples
     * @return       Structure and exclusion masks
     * @throws InvalidShapeError on unsupported image layout
     */
    [[nodiscard]] SegmentationResult segment(const cv::Mat& image) const;

    [[nodiscard]] const SegmentationOptions& options() const noexcept { return options_; }

private:
    SegmentationOptions options_;
};

/**
 * Segment with default options
 *
 * @return  (structure_mask, exclusion_mask)
 */
[[nodiscard]] std::pair<BinaryMask, BinaryMask> detect_chemical_structures(const cv::Mat& image);

/**
 * Result of processing an image file
 */
struct ProcessResult {
    ResultCode code;           // Success or failure reason
    int regions;               // Structure regions found (when seeds requested)
    size_t seeds;              // Total seeds written
    std::string message;       // Status message

    [[nodiscard]] bool success() const noexcept { return code == ResultCode::Success; }
};

/**
 * Output options for process_image
 */
struct OutputOptions {
    bool write_seeds{false};        // Also write <stem>_seeds.csv
    SeedOptions seed_options;
    int min_region_area{0};         // Skip smaller structure components
};

/**
 * Process a single image file
 *
 * Writes <stem>_structure.png and <stem>_exclusion.png (and optionally
 * <stem>_seeds.csv) into output_dir. Never throws; failures are logged and
 * reported through the result code.
 *
 * @param input_path  Input image path
 * @param output_dir  Output directory (created if missing)
 * @param segmenter   The segmenter to use
 * @param output      What to write
 * @return            Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_dir,
    const StructureSegmenter& segmenter,
    const OutputOptions& output = {}
);

/**
 * Write per-region seeds as CSV with header "region,x,y"
 *
 * @return  true if the file was written
 */
bool write_seeds_csv(
    const std::filesystem::path& path,
    const std::vector<RegionSeeds>& region_seeds
);

}  // namespace smt
