/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line interface for Structure Mask Tool.
 * Supports single file processing, batch processing, and drag & drop.
 */

#include "cli/cli_app.hpp"
#include "core/runtime_config.hpp"
#include "core/structure_segmenter.hpp"
#include "core/types.hpp"
#include "utils/formatters.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace smt::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "Structure Mask Tool\n");
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", kVersion);
    fmt::print("\n");
}

// =============================================================================
// Processing helpers
// =============================================================================

struct BatchResult {
    int success = 0;
    int fail = 0;

    void print() const {
        if (success + fail > 1) {
            fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", success);
            if (fail > 0) {
                fmt::print(fmt::fg(fmt::color::red), ", {} failed", fail);
            }
            fmt::print("\n");
        }
    }
};

bool is_supported_image(const fs::path& path) {
    static constexpr std::array<std::string_view, 7> kExtensions = {
        ".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff", ".webp"
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

void process_single(
    const fs::path& input,
    const fs::path& output_dir,
    const StructureSegmenter& segmenter,
    const OutputOptions& output,
    BatchResult& result
) {
    const ProcessResult processed = process_image(input, output_dir, segmenter, output);
    if (processed.success()) {
        result.success++;
    } else {
        spdlog::debug("{}: {} ({})", input.filename(), to_string(processed.code), processed.message);
        result.fail++;
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

bool is_simple_mode(int argc, char** argv) {
    if (argc < 2) return false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!arg.empty() && arg[0] == '-') {
            return false;
        }
    }
    return true;
}

int run_simple_mode(int argc, char** argv) {
    setup_console();
    print_banner();

    configure_runtime(RuntimeOptions{});

    BatchResult result;

    try {
        const StructureSegmenter segmenter;

        for (int i = 1; i < argc; ++i) {
            fs::path input(argv[i]);

            if (!fs::exists(input)) {
                spdlog::error("File not found: {}", argv[i]);
                result.fail++;
                continue;
            }

            if (fs::is_directory(input)) {
                spdlog::error("Skipping directory: {} (For directory processing, use -i <dir> -o <dir>)", argv[i]);
                result.fail++;
                continue;
            }

            process_single(input, input.parent_path(), segmenter, OutputOptions{}, result);
        }

        result.print();
        return (result.fail > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

int run(int argc, char** argv) {
    // Check for simple mode first
    if (is_simple_mode(argc, argv)) {
        return run_simple_mode(argc, argv);
    }

    setup_console();

    CLI::App app{"Structure Mask Tool - Separate chemical structure drawings from table lines and rules"};
    app.footer("\nSimple usage: StructureMaskTool <image>  (masks written next to the image)");
    print_banner();

    app.set_version_flag("-V,--version", kVersion);

    // Input/Output paths
    std::string input_path;
    std::string output_path;

    app.add_option("-i,--input", input_path, "Input image file or directory")
        ->required()
        ->check(CLI::ExistingPath);

    app.add_option("-o,--output", output_path, "Output directory")
        ->required();

    // Segmentation parameters
    SegmentationOptions options;
    double threshold = -1.0;
    app.add_option("-t,--threshold", threshold, "Fixed binarization threshold (0-255, default: Otsu)")
        ->check(CLI::Range(0.0, 255.0));
    app.add_option("--kernel-size", options.structure_kernel_size, "Structure mask element size")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--depiction-divisor", options.depiction_size_divisor,
                   "Depiction size = page size / divisor")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_flag("--axis-lines", options.include_axis_aligned_lines,
                 "Also exclude long horizontal/vertical runs");

    // Seeds
    OutputOptions output;
    app.add_flag("--seeds", output.write_seeds, "Write per-region seed points as CSV");
    app.add_option("--seed-border", output.seed_options.border_fraction,
                   "Fraction trimmed from each side of a region before seeding")
        ->check(CLI::Range(0.0, 0.49))
        ->capture_default_str();
    app.add_option("--min-region-area", output.min_region_area, "Ignore smaller structure regions")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    // Runtime
    RuntimeOptions runtime;
    app.add_option("--threads", runtime.num_threads, "OpenCV worker threads (default: library choice)");

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    if (quiet) {
        runtime.log_level = spdlog::level::err;
    } else if (verbose) {
        runtime.log_level = spdlog::level::debug;
    }
    configure_runtime(runtime);

    if (threshold >= 0.0) {
        options.binarize.threshold = threshold;
        spdlog::info("Using fixed threshold {:.1f}", threshold);
    }

    try {
        const StructureSegmenter segmenter(options);

        fs::path input(input_path);
        fs::path output_dir(output_path);

        BatchResult result;

        if (fs::is_directory(input)) {
            spdlog::info("Batch processing directory: {}", input);

            for (const auto& entry : fs::directory_iterator(input)) {
                if (!entry.is_regular_file()) continue;
                if (!is_supported_image(entry.path())) continue;

                process_single(entry.path(), output_dir, segmenter, output, result);
            }

            result.print();
        } else {
            process_single(input, output_dir, segmenter, output, result);
            if (result.success == 1) {
                fmt::print(fmt::fg(fmt::color::green), "[OK] Success: {}\n", to_utf8(output_dir));
            }
        }

        return (result.fail > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace smt::cli
