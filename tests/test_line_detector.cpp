#include "core/line_detector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <stdexcept>

namespace smt {
namespace {

constexpr int kPage = 200;
// Odd sizes keep the directional elements centred
constexpr DepictionSize kDepiction{21, 21};

// =============================================================================
// Helpers
// =============================================================================

TEST(EquidistantPointsTest, FiveDivisionsAlongXAxis) {
    const auto points = find_equidistant_points({0, 0}, {10, 0}, 5);

    ASSERT_EQ(points.size(), 6u);
    const double expected_x[] = {0, 2, 4, 6, 8, 10};
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_DOUBLE_EQ(points[i].x, expected_x[i]);
        EXPECT_DOUBLE_EQ(points[i].y, 0.0);
    }
}

TEST(EquidistantPointsTest, IncludesBothEndpointsInOrder) {
    const auto points = find_equidistant_points({14, 7}, {0, 0}, 7);

    ASSERT_EQ(points.size(), 8u);
    EXPECT_DOUBLE_EQ(points.front().x, 14.0);
    EXPECT_DOUBLE_EQ(points.front().y, 7.0);
    EXPECT_DOUBLE_EQ(points[1].x, 12.0);
    EXPECT_DOUBLE_EQ(points[1].y, 6.0);
    EXPECT_DOUBLE_EQ(points.back().x, 0.0);
    EXPECT_DOUBLE_EQ(points.back().y, 0.0);
}

TEST(EquidistantPointsTest, RejectsZeroDivisions) {
    EXPECT_THROW((void)find_equidistant_points({0, 0}, {1, 1}, 0), std::invalid_argument);
}

TEST(DepictionSizeTest, TenthOfThePage) {
    const DepictionSize size = estimate_depiction_size(cv::Size(300, 200));
    EXPECT_EQ(size.max_height, 20);
    EXPECT_EQ(size.max_width, 30);

    const DepictionSize tiny = estimate_depiction_size(cv::Size(5, 5));
    EXPECT_EQ(tiny.max_height, 1);
    EXPECT_EQ(tiny.max_width, 1);

    EXPECT_THROW((void)estimate_depiction_size(cv::Size(10, 10), 0), std::invalid_argument);
}

// =============================================================================
// Axis-aligned detector
// =============================================================================

TEST(AxisAlignedLinesTest, LongHorizontalRunIsDetected) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 100}, {179, 100});

    const BinaryMask exclusion = detect_axis_aligned_lines(ink, kDepiction);

    EXPECT_EQ(exclusion.size(), ink.size());
    EXPECT_GT(cv::countNonZero(exclusion), 0);
    EXPECT_EQ(test::count_overlap(exclusion, ink), cv::countNonZero(ink));
}

TEST(AxisAlignedLinesTest, LongVerticalRunIsDetected) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {60, 10}, {60, 189});

    const BinaryMask exclusion = detect_axis_aligned_lines(ink, kDepiction);

    EXPECT_EQ(test::count_overlap(exclusion, ink), cv::countNonZero(ink));
}

TEST(AxisAlignedLinesTest, ShortRunIsIgnored) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {50, 100}, {59, 100});

    const BinaryMask exclusion = detect_axis_aligned_lines(ink, kDepiction);

    EXPECT_EQ(cv::countNonZero(exclusion), 0);
}

TEST(AxisAlignedLinesTest, DiagonalStrokeIsIgnored) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 20}, {180, 180});

    const BinaryMask exclusion = detect_axis_aligned_lines(ink, kDepiction);

    EXPECT_EQ(cv::countNonZero(exclusion), 0);
}

TEST(AxisAlignedLinesTest, ExtraIterationsNeedLongerRuns) {
    // 40 px run: survives one 1x21 opening, not three (3 * 20 + 1 = 61)
    const BinaryMask ink = test::line_mask(kPage, kPage, {50, 100}, {89, 100});

    LineDetectionOptions once;
    once.axis_open_iterations = 1;
    LineDetectionOptions thrice;
    thrice.axis_open_iterations = 3;

    EXPECT_EQ(cv::countNonZero(detect_axis_aligned_lines(ink, kDepiction, once)), 40);
    EXPECT_EQ(cv::countNonZero(detect_axis_aligned_lines(ink, kDepiction, thrice)), 0);
}

// =============================================================================
// Geometric detector
// =============================================================================

TEST(SegmentSamplingTest, EndpointsAreNeverSampled) {
    const LineSegment segment{20, 100, 180, 100};

    BinaryMask candidate = test::blank_mask(kPage, kPage);
    candidate(100, 20) = kMaskOn;
    candidate(100, 180) = kMaskOn;
    EXPECT_FALSE(segment_touches_mask(segment, candidate, 7));

    // First interior sample: x = 20 + 160 / 7 = 42.86 -> 42
    candidate(100, 42) = kMaskOn;
    EXPECT_TRUE(segment_touches_mask(segment, candidate, 7));
}

TEST(SegmentSamplingTest, AnySingleSampleIsEnough) {
    const LineSegment segment{0, 0, 71, 0};
    BinaryMask candidate = test::blank_mask(10, 100);

    // Samples at x = 10.1, 20.3, ..., 60.9
    candidate(0, 60) = kMaskOn;
    EXPECT_TRUE(segment_touches_mask(segment, candidate, 7));

    candidate(0, 60) = 0;
    candidate(0, 65) = kMaskOn;
    EXPECT_FALSE(segment_touches_mask(segment, candidate, 7));
}

// =============================================================================
// Sample division sweep
// =============================================================================

class SampleDivisionSweep : public ::testing::TestWithParam<int> {};

TEST_P(SampleDivisionSweep, PointsAreEvenlySpaced) {
    const int n = GetParam();

    const auto points = find_equidistant_points({20, 100}, {180, 100}, n);

    ASSERT_EQ(points.size(), static_cast<size_t>(n) + 1);
    EXPECT_DOUBLE_EQ(points.front().x, 20.0);
    EXPECT_DOUBLE_EQ(points.back().x, 180.0);
    for (size_t i = 1; i < points.size(); ++i) {
        EXPECT_NEAR(points[i].x - points[i - 1].x, 160.0 / n, 1e-9);
        EXPECT_DOUBLE_EQ(points[i].y, 100.0);
    }
}

TEST_P(SampleDivisionSweep, OnlyInteriorSamplesCount) {
    const int n = GetParam();
    const LineSegment segment{20, 100, 180, 100};

    BinaryMask endpoints = test::blank_mask(kPage, kPage);
    endpoints(100, 20) = kMaskOn;
    endpoints(100, 180) = kMaskOn;
    EXPECT_FALSE(segment_touches_mask(segment, endpoints, n));

    const BinaryMask interior = test::filled_rect_mask(kPage, kPage, cv::Rect(21, 100, 159, 1));
    EXPECT_TRUE(segment_touches_mask(segment, interior, n));
}

TEST_P(SampleDivisionSweep, ClassificationFollowsCandidateMask) {
    LineDetectionOptions options;
    options.sample_divisions = GetParam();
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 100}, {180, 100});

    const BinaryMask band = test::filled_rect_mask(kPage, kPage, cv::Rect(0, 90, kPage, 21));
    EXPECT_EQ(cv::countNonZero(detect_geometric_lines(ink, kDepiction, band, options)), 0);

    const BinaryMask nothing = test::blank_mask(kPage, kPage);
    EXPECT_GT(cv::countNonZero(detect_geometric_lines(ink, kDepiction, nothing, options)), 0);
}

INSTANTIATE_TEST_SUITE_P(Divisions, SampleDivisionSweep, ::testing::Values(2, 3, 5, 7, 11, 16));

TEST(SegmentSamplingTest, SingleDivisionHasNoInteriorSamples) {
    const LineSegment segment{20, 100, 180, 100};
    const BinaryMask everything = test::filled_rect_mask(kPage, kPage, cv::Rect(0, 0, kPage, kPage));

    EXPECT_FALSE(segment_touches_mask(segment, everything, 1));
}

TEST(GeometricLinesTest, IsolatedSegmentIsExcluded) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 100}, {180, 100});
    const BinaryMask candidate = test::blank_mask(kPage, kPage);

    const LineDetectionResult result = classify_lines(ink, kDepiction, candidate);

    EXPECT_EQ(result.exclusion_mask.size(), ink.size());
    EXPECT_FALSE(result.noise_segments.empty());
    EXPECT_TRUE(result.structure_segments.empty());
    EXPECT_GT(test::count_overlap(result.exclusion_mask, ink), cv::countNonZero(ink) / 2);

    // 3 px thick rasterization stays on the line
    EXPECT_EQ(cv::countNonZero(result.exclusion_mask(cv::Rect(0, 0, kPage, 97))), 0);
    EXPECT_EQ(cv::countNonZero(result.exclusion_mask(cv::Rect(0, 104, kPage, 96))), 0);
}

TEST(GeometricLinesTest, SegmentInsideCandidateIsKept) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 100}, {180, 100});
    const BinaryMask candidate = test::filled_rect_mask(kPage, kPage, cv::Rect(0, 90, kPage, 21));

    const LineDetectionResult result = classify_lines(ink, kDepiction, candidate);

    EXPECT_EQ(cv::countNonZero(result.exclusion_mask), 0);
    EXPECT_TRUE(result.noise_segments.empty());
    EXPECT_FALSE(result.structure_segments.empty());
}

TEST(GeometricLinesTest, SlantedSegmentIsExcluded) {
    const BinaryMask ink = test::line_mask(kPage, kPage, {20, 30}, {180, 150});
    const BinaryMask candidate = test::blank_mask(kPage, kPage);

    const BinaryMask exclusion = detect_geometric_lines(ink, kDepiction, candidate);

    EXPECT_GT(test::count_overlap(exclusion, ink), 0);
}

TEST(GeometricLinesTest, EmptyPageGivesEmptyMask) {
    const BinaryMask ink = test::blank_mask(80, 120);

    const BinaryMask exclusion = detect_geometric_lines(ink, kDepiction, ink);

    EXPECT_EQ(exclusion.size(), ink.size());
    EXPECT_EQ(cv::countNonZero(exclusion), 0);
}

TEST(GeometricLinesTest, RejectsMismatchedCandidate) {
    const BinaryMask ink = test::blank_mask(kPage, kPage);
    const BinaryMask candidate = test::blank_mask(kPage / 2, kPage);

    EXPECT_THROW((void)detect_geometric_lines(ink, kDepiction, candidate), InvalidShapeError);
}

}  // namespace
}  // namespace smt
