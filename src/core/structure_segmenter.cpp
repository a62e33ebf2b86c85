/**
 * @file    structure_segmenter.cpp
 * @brief   Structure Mask Tool - Segmentation Pipeline
 * @author  AllenK (Kwyshell)
 * @date    2025.12.13
 * @license MIT
 *
 * @details
 * Composes binarizer, structure mask builder and line detectors into the
 * (structure_mask, exclusion_mask) pair consumed by region growing.
 */

#include "core/structure_segmenter.hpp"
#include "core/binarizer.hpp"
#include "core/line_detector.hpp"
#include "core/mask_ops.hpp"
#include "core/structure_mask.hpp"
#include "utils/formatters.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>

namespace smt {

StructureSegmenter::StructureSegmenter(const SegmentationOptions& options)
    : options_(options) {
    validate(options_);
}

SegmentationResult StructureSegmenter::segment(const cv::Mat& image) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    const BinarizeResult binary = binarize(image, options_.binarize);

    SegmentationResult result{};
    result.threshold = binary.threshold;

    // Dark ink on white paper: the binarized paper is the background
    result.ink_mask = invert_mask(binary.mask);
    result.structure_mask = build_structure_mask(result.ink_mask, options_.structure_kernel_size);
    result.depiction_size = estimate_depiction_size(image.size(), options_.depiction_size_divisor);

    result.exclusion_mask = detect_geometric_lines(
        result.ink_mask, result.depiction_size, result.structure_mask, options_.lines);

    if (options_.include_axis_aligned_lines) {
        const BinaryMask axis_mask = detect_axis_aligned_lines(
            result.ink_mask, result.depiction_size, options_.lines);
        result.exclusion_mask = combine_masks(result.exclusion_mask, axis_mask);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        end_time - start_time).count();

    spdlog::info("Segmented {} image in {} us: threshold={:.1f} depiction={}x{} "
                 "structure={} px exclusion={} px",
                 image.size(), duration, result.threshold,
                 result.depiction_size.max_width, result.depiction_size.max_height,
                 cv::countNonZero(result.structure_mask),
                 cv::countNonZero(result.exclusion_mask));

    return result;
}

std::pair<BinaryMask, BinaryMask> detect_chemical_structures(const cv::Mat& image) {
    const StructureSegmenter segmenter;
    SegmentationResult result = segmenter.segment(image);
    return {std::move(result.structure_mask), std::move(result.exclusion_mask)};
}

// =============================================================================
// File processing
// =============================================================================

bool write_seeds_csv(
    const std::filesystem::path& path,
    const std::vector<RegionSeeds>& region_seeds)
{
    std::ofstream out(path);
    if (!out) {
        spdlog::error("Failed to open seed file: {}", path);
        return false;
    }

    out << "region,x,y\n";
    for (const auto& entry : region_seeds) {
        for (const auto& seed : entry.seeds) {
            out << fmt::format("{},{},{}\n", entry.region.index, seed.x, seed.y);
        }
    }

    out.flush();
    return static_cast<bool>(out);
}

namespace {

bool write_mask(const std::filesystem::path& path, const BinaryMask& mask) {
    const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    return cv::imwrite(path.string(), mask, params);
}

}  // anonymous namespace

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_dir,
    const StructureSegmenter& segmenter,
    const OutputOptions& output) {

    ProcessResult result{};
    result.code = ResultCode::ProcessingFailed;

    try {
        if (!std::filesystem::exists(input_path)) {
            result.code = ResultCode::FileNotFound;
            result.message = "File not found";
            spdlog::error("File not found: {}", input_path);
            return result;
        }

        // Decoder does the luminance conversion; keep 16-bit depth
        cv::Mat image = cv::imread(input_path.string(),
                                   cv::IMREAD_GRAYSCALE | cv::IMREAD_ANYDEPTH);
        if (image.empty()) {
            result.code = ResultCode::InvalidFormat;
            result.message = "Failed to load image";
            spdlog::error("Failed to load image: {}", input_path);
            return result;
        }

        spdlog::info("Processing: {} ({})", input_path.filename(), image.size());

        const SegmentationResult segmentation = segmenter.segment(image);

        if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
            std::filesystem::create_directories(output_dir);
        }

        const std::string stem = to_utf8(input_path.stem());
        const auto structure_path = output_dir / (stem + "_structure.png");
        const auto exclusion_path = output_dir / (stem + "_exclusion.png");

        if (!write_mask(structure_path, segmentation.structure_mask) ||
            !write_mask(exclusion_path, segmentation.exclusion_mask)) {
            result.code = ResultCode::SaveFailed;
            result.message = "Failed to write masks";
            spdlog::error("Failed to write masks to: {}", output_dir);
            return result;
        }

        if (output.write_seeds) {
            const auto region_seeds = extract_region_seeds(
                segmentation.ink_mask,
                segmentation.structure_mask,
                segmentation.exclusion_mask,
                output.seed_options,
                output.min_region_area);

            result.regions = static_cast<int>(region_seeds.size());
            for (const auto& entry : region_seeds) {
                result.seeds += entry.seeds.size();
            }

            const auto seeds_path = output_dir / (stem + "_seeds.csv");
            if (!write_seeds_csv(seeds_path, region_seeds)) {
                result.code = ResultCode::SaveFailed;
                result.message = "Failed to write seeds";
                return result;
            }
            spdlog::debug("Wrote {} seeds for {} regions", result.seeds, result.regions);
        }

        result.code = ResultCode::Success;
        result.message = output.write_seeds
            ? fmt::format("Masks and {} seeds written", result.seeds)
            : std::string("Masks written");
        spdlog::info("Saved: {}, {}", structure_path.filename(), exclusion_path.filename());
        return result;

    } catch (const std::exception& e) {
        result.code = ResultCode::ProcessingFailed;
        result.message = std::string("Error: ") + e.what();
        spdlog::error("Error processing {}: {}", input_path, e.what());
        return result;
    }
}

}  // namespace smt
