#include "core/runtime_config.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <memory>
#include <string>

namespace smt {
namespace {

TEST(RuntimeConfigTest, InstallsDefaultLogger) {
    RuntimeOptions options;
    options.log_level = spdlog::level::warn;

    configure_runtime(options);

    ASSERT_NE(spdlog::get("smt"), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "smt");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}

TEST(RuntimeConfigTest, RepeatedCallsReuseLogger) {
    configure_runtime(RuntimeOptions{});
    const auto first = spdlog::get("smt");

    RuntimeOptions quiet;
    quiet.log_level = spdlog::level::err;
    configure_runtime(quiet);

    EXPECT_EQ(spdlog::get("smt"), first);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
}

TEST(RuntimeConfigTest, ReportsOpenCLAtDebugLevel) {
    configure_runtime(RuntimeOptions{});
    auto logger = spdlog::get("smt");
    ASSERT_NE(logger, nullptr);

    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    sink->set_pattern("%l|%v");
    logger->sinks().push_back(sink);

    RuntimeOptions options;
    options.log_level = spdlog::level::debug;
    configure_runtime(options);

    logger->sinks().pop_back();

    const auto lines = sink->last_formatted();
    const auto report = std::find_if(lines.begin(), lines.end(), [](const std::string& line) {
        return line.rfind("debug|OpenCL: ", 0) == 0;
    });
    EXPECT_NE(report, lines.end());

    // Device enumeration never warns
    EXPECT_TRUE(std::none_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.rfind("warning|", 0) == 0;
    }));
}

}  // namespace
}  // namespace smt
