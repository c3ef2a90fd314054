#include "OutlierDetector.h"

#include <gtest/gtest.h>

#include <numeric>
#include <stdexcept>

namespace {
std::vector<size_t> iota(size_t n) {
    std::vector<size_t> rows(n);
    std::iota(rows.begin(), rows.end(), 0);
    return rows;
}
}

TEST(OutlierDetectorTest, FlagsValueBeyondUpperFence)
{
    const std::vector<double> values{1, 2, 3, 4, 5, 100};
    const OutlierReport report = OutlierDetector::detect(values, iota(values.size()));

    EXPECT_NEAR(*report.q1, 2.25, 1e-12);
    EXPECT_NEAR(*report.q3, 4.75, 1e-12);
    EXPECT_NEAR(*report.iqr, 2.5, 1e-12);
    EXPECT_NEAR(*report.lowerFence, -1.5, 1e-12);
    EXPECT_NEAR(*report.upperFence, 8.5, 1e-12);
    ASSERT_EQ(report.count(), 1u);
    EXPECT_EQ(report.outliers[0].row, 5u);
    EXPECT_DOUBLE_EQ(report.outliers[0].value, 100.0);
}

TEST(OutlierDetectorTest, ReportsOriginalRowIndices)
{
    // Rows 1 and 4 were missing in the source column.
    const std::vector<double> values{-50, 10, 11, 12, 13};
    const std::vector<size_t> rows{0, 2, 3, 5, 6};
    const OutlierReport report = OutlierDetector::detect(values, rows);
    ASSERT_EQ(report.count(), 1u);
    EXPECT_EQ(report.outliers[0].row, 0u);
}

TEST(OutlierDetectorTest, OutliersAreSortedByRow)
{
    const std::vector<double> values{500, 1, 2, 3, 4, 5, -500};
    const std::vector<size_t> rows{9, 1, 2, 3, 4, 5, 0};
    const OutlierReport report = OutlierDetector::detect(values, rows);
    ASSERT_EQ(report.count(), 2u);
    EXPECT_EQ(report.outliers[0].row, 0u);
    EXPECT_EQ(report.outliers[1].row, 9u);
}

TEST(OutlierDetectorTest, TooFewValuesGiveEmptyReport)
{
    const OutlierReport report = OutlierDetector::detect({1, 2, 1000}, {0, 1, 2});
    EXPECT_EQ(report.count(), 0u);
    EXPECT_FALSE(report.q1);
    EXPECT_FALSE(report.lowerFence);
    EXPECT_FALSE(report.upperFence);
}

TEST(OutlierDetectorTest, ValuesOnFenceAreNotOutliers)
{
    // Q1 = 2, Q3 = 4, IQR = 2: fences at -1 and 7.
    const OutlierReport report = OutlierDetector::detect({-1, 2, 3, 4, 7}, iota(5));
    EXPECT_NEAR(*report.lowerFence, -1.0, 1e-12);
    EXPECT_NEAR(*report.upperFence, 7.0, 1e-12);
    EXPECT_EQ(report.count(), 0u);
}

TEST(OutlierDetectorTest, ZeroMultiplierUsesQuartilesAsFences)
{
    const OutlierReport report = OutlierDetector::detect({1, 2, 3, 4, 5}, iota(5), 0.0);
    ASSERT_EQ(report.count(), 2u);
    EXPECT_EQ(report.outliers[0].row, 0u);
    EXPECT_EQ(report.outliers[1].row, 4u);
}

TEST(OutlierDetectorTest, ConstantColumnHasNoOutliers)
{
    const OutlierReport report = OutlierDetector::detect({3, 3, 3, 3, 3}, iota(5));
    EXPECT_DOUBLE_EQ(*report.iqr, 0.0);
    EXPECT_EQ(report.count(), 0u);
}

TEST(OutlierDetectorTest, MismatchedLengthsThrow)
{
    EXPECT_THROW(OutlierDetector::detect({1, 2, 3, 4}, {0, 1}), std::invalid_argument);
}
