/// @file tests/stats/test_stats.cpp
/// @brief Tests for the moment, correlation and gather helpers.

#include "erastat/stats.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace erastat;

namespace {

Column col(std::initializer_list<double> values) {
    Column c(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) c[i++] = v;
    return c;
}

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // anonymous namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

TEST(StatsMoments, MeanAndPopulationStd) {
    const std::vector<double> v{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(stats::mean(v), 2.5);
    // ddof = 0: sqrt(1.25)
    EXPECT_NEAR(stats::pop_stddev(v), std::sqrt(1.25), 1e-15);
}

TEST(StatsMoments, EmptyInputsAreZero) {
    const std::vector<double> empty;
    EXPECT_DOUBLE_EQ(stats::mean(empty), 0.0);
    EXPECT_DOUBLE_EQ(stats::pop_stddev(empty), 0.0);
    EXPECT_DOUBLE_EQ(stats::column_stddev(Column(0)), 0.0);
}

TEST(StatsMoments, ColumnStdMatchesSpanStd) {
    const Column c = col({0.5, -1.0, 2.0, 7.5});
    const std::vector<double> v(c.data(), c.data() + c.size());
    EXPECT_NEAR(stats::column_stddev(c), stats::pop_stddev(v), 1e-14);
}

TEST(StatsMoments, NanMeanSkipsNonFinite) {
    const std::vector<double> v{1.0, kNaN, 3.0};
    ASSERT_TRUE(stats::nan_mean(v).has_value());
    EXPECT_DOUBLE_EQ(*stats::nan_mean(v), 2.0);

    const std::vector<double> all_nan{kNaN, kNaN};
    EXPECT_FALSE(stats::nan_mean(all_nan).has_value());
}

// ─── Pearson ──────────────────────────────────────────────────────────────────

TEST(StatsPearson, PerfectLinearRelations) {
    const Column a = col({1.0, 2.0, 3.0, 4.0});
    const Column b = col({2.0, 4.0, 6.0, 8.0});
    const Column c = col({4.0, 3.0, 2.0, 1.0});
    EXPECT_NEAR(*stats::pearson(a, b), 1.0, 1e-12);
    EXPECT_NEAR(*stats::pearson(a, c), -1.0, 1e-12);
}

TEST(StatsPearson, KnownValue) {
    // x = 1..5, y = (2, 4, 5, 4, 5): r = 6 / sqrt(10 · 6)
    const Column x = col({1.0, 2.0, 3.0, 4.0, 5.0});
    const Column y = col({2.0, 4.0, 5.0, 4.0, 5.0});
    EXPECT_NEAR(*stats::pearson(x, y), 6.0 / std::sqrt(60.0), 1e-12);
}

TEST(StatsPearson, ConstantSideIsUndefined) {
    const Column a = col({1.0, 2.0, 3.0});
    const Column k = col({0.5, 0.5, 0.5});
    EXPECT_FALSE(stats::pearson(a, k).has_value());
}

TEST(StatsPearson, TooFewPairsIsUndefined) {
    EXPECT_FALSE(stats::pearson(col({1.0}), col({2.0})).has_value());
    EXPECT_FALSE(stats::pearson(col({1.0, kNaN, 3.0}), col({kNaN, 2.0, 1.0})).has_value());
}

TEST(StatsPearson, LengthMismatchIsUndefined) {
    EXPECT_FALSE(stats::pearson(col({1.0, 2.0}), col({1.0, 2.0, 3.0})).has_value());
}

TEST(StatsPearson, UsesPairwiseCompleteRows) {
    // Row 2 is dropped from both sides; the remainder is perfectly correlated.
    const Column a = col({1.0, 2.0, kNaN, 4.0});
    const Column b = col({1.0, 2.0, 100.0, 4.0});
    EXPECT_NEAR(*stats::pearson(a, b), 1.0, 1e-12);
}

// ─── Covariance ───────────────────────────────────────────────────────────────

TEST(StatsCovariance, SampleCovariance) {
    // cov((1,2,3), (1,2,3)) with ddof = 1 is the sample variance: 1.0
    const Column a = col({1.0, 2.0, 3.0});
    EXPECT_NEAR(*stats::covariance(a, a), 1.0, 1e-15);
}

TEST(StatsCovariance, ConstantSideIsZeroNotUndefined) {
    const Column a = col({1.0, 2.0, 3.0});
    const Column k = col({5.0, 5.0, 5.0});
    ASSERT_TRUE(stats::covariance(a, k).has_value());
    EXPECT_NEAR(*stats::covariance(a, k), 0.0, 1e-15);
}

// ─── Gathering ────────────────────────────────────────────────────────────────

TEST(StatsGather, PicksRowsInGivenOrder) {
    const Column v = col({10.0, 11.0, 12.0, 13.0});
    const Column g = stats::gather(v, {3, 0});
    ASSERT_EQ(g.size(), 2);
    EXPECT_DOUBLE_EQ(g[0], 13.0);
    EXPECT_DOUBLE_EQ(g[1], 10.0);

    Matrix m(3, 2);
    m << 1, 2,
         3, 4,
         5, 6;
    const Matrix r = stats::gather_rows(m, {2, 1});
    EXPECT_DOUBLE_EQ(r(0, 0), 5.0);
    EXPECT_DOUBLE_EQ(r(1, 1), 4.0);
}
