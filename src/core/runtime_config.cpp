/**
 * @file    runtime_config.cpp
 * @brief   Process-wide logging and OpenCV runtime setup
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/runtime_config.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/ocl.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace smt {

namespace {

constexpr const char* kLoggerName = "smt";

void setup_logger(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

}  // anonymous namespace

void configure_runtime(const RuntimeOptions& options) {
    setup_logger(options.log_level);

    if (options.num_threads >= 0) {
        cv::setNumThreads(options.num_threads);
    }

    spdlog::debug("OpenCV {}: {} CPUs, {} threads",
                  CV_VERSION, cv::getNumberOfCPUs(), cv::getNumThreads());

    // Device report only; the pipeline runs on cv::Mat and stays on the CPU
    if (!cv::ocl::haveOpenCL()) {
        spdlog::debug("OpenCL: not available");
        return;
    }

    const cv::ocl::Device& device = cv::ocl::Device::getDefault();
    if (device.available()) {
        spdlog::debug("OpenCL: {} ({})", device.name(), device.vendorName());
    } else {
        spdlog::debug("OpenCL: runtime present, no default device");
    }
}

}  // namespace smt
