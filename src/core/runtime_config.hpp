/**
 * @file    runtime_config.hpp
 * @brief   Process-wide logging and OpenCV runtime setup
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Called once by the process entry point. The segmentation core never
 * reads any of this state.
 */

#pragma once

#include <spdlog/common.h>

namespace smt {

/**
 * Runtime options
 */
struct RuntimeOptions {
    spdlog::level::level_enum log_level{spdlog::level::info};
    int num_threads{-1};        // OpenCV worker threads, < 0 = library default
};

/**
 * Install the "smt" console logger and apply the OpenCV thread count
 *
 * Safe to call more than once; the logger is created on the first call.
 * OpenCV version, CPU count and any OpenCL device are reported at debug level.
 */
void configure_runtime(const RuntimeOptions& options);

}  // namespace smt
