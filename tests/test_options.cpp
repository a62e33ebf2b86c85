#include "core/options.hpp"
#include "core/structure_segmenter.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace smt {
namespace {

TEST(OptionsTest, DefaultsAreValid) {
    EXPECT_NO_THROW(validate(SegmentationOptions{}));
    EXPECT_NO_THROW(validate(LineDetectionOptions{}));
    EXPECT_NO_THROW(validate(SeedOptions{}));
}

TEST(OptionsTest, DefaultsMatchPipelineConstants) {
    const SegmentationOptions options;

    EXPECT_FALSE(options.binarize.threshold.has_value());
    EXPECT_EQ(options.binarize.channel_order, ChannelOrder::RGB);
    EXPECT_EQ(options.structure_kernel_size, 5);
    EXPECT_EQ(options.depiction_size_divisor, 10);
    EXPECT_FALSE(options.include_axis_aligned_lines);
    EXPECT_DOUBLE_EQ(options.lines.rho, 1.0);
    EXPECT_DOUBLE_EQ(options.lines.theta_degrees, 1.0);
    EXPECT_EQ(options.lines.vote_threshold, 5);
    EXPECT_EQ(options.lines.min_length_divisor, 4);
    EXPECT_EQ(options.lines.max_line_gap, 10);
    EXPECT_EQ(options.lines.sample_divisions, 7);
    EXPECT_EQ(options.lines.line_thickness, 3);
    EXPECT_EQ(options.lines.axis_open_iterations, 2);
    EXPECT_DOUBLE_EQ(SeedOptions{}.border_fraction, 0.1);
}

TEST(OptionsTest, ThresholdRange) {
    SegmentationOptions options;

    options.binarize.threshold = 0.0;
    EXPECT_NO_THROW(validate(options));
    options.binarize.threshold = 255.0;
    EXPECT_NO_THROW(validate(options));

    options.binarize.threshold = 300.0;
    EXPECT_THROW(validate(options), std::invalid_argument);
    options.binarize.threshold = -1.0;
    EXPECT_THROW(validate(options), std::invalid_argument);
}

TEST(OptionsTest, RejectsNonPositiveSizes) {
    SegmentationOptions kernel;
    kernel.structure_kernel_size = 0;
    EXPECT_THROW(validate(kernel), std::invalid_argument);

    SegmentationOptions divisor;
    divisor.depiction_size_divisor = 0;
    EXPECT_THROW(validate(divisor), std::invalid_argument);
}

TEST(OptionsTest, RejectsBadLineParameters) {
    LineDetectionOptions rho;
    rho.rho = 0.0;
    EXPECT_THROW(validate(rho), std::invalid_argument);

    LineDetectionOptions theta;
    theta.theta_degrees = 181.0;
    EXPECT_THROW(validate(theta), std::invalid_argument);

    LineDetectionOptions gap;
    gap.max_line_gap = -1;
    EXPECT_THROW(validate(gap), std::invalid_argument);

    LineDetectionOptions samples;
    samples.sample_divisions = 0;
    EXPECT_THROW(validate(samples), std::invalid_argument);

    LineDetectionOptions iterations;
    iterations.axis_open_iterations = 0;
    EXPECT_THROW(validate(iterations), std::invalid_argument);

    // Nested line options are checked too
    SegmentationOptions nested;
    nested.lines.line_thickness = 0;
    EXPECT_THROW(validate(nested), std::invalid_argument);
}

TEST(OptionsTest, BorderFractionRange) {
    SeedOptions options;

    options.border_fraction = 0.0;
    EXPECT_NO_THROW(validate(options));
    options.border_fraction = 0.49;
    EXPECT_NO_THROW(validate(options));

    options.border_fraction = 0.5;
    EXPECT_THROW(validate(options), std::invalid_argument);
    options.border_fraction = -0.1;
    EXPECT_THROW(validate(options), std::invalid_argument);
}

TEST(OptionsTest, SegmenterValidatesOnConstruction) {
    SegmentationOptions options;
    options.structure_kernel_size = -3;

    EXPECT_THROW(StructureSegmenter{options}, std::invalid_argument);

    options.structure_kernel_size = 7;
    const StructureSegmenter segmenter(options);
    EXPECT_EQ(segmenter.options().structure_kernel_size, 7);
}

TEST(OptionsTest, ChannelOrderNames) {
    EXPECT_EQ(to_string(ChannelOrder::RGB), "RGB");
    EXPECT_EQ(to_string(ChannelOrder::BGR), "BGR");
}

}  // namespace
}  // namespace smt
