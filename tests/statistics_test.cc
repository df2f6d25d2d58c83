#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "autoviz/statistics.h"
#include <cmath>
#include <numeric>

namespace autoviz {
namespace testing {

class StatisticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (size_t i = 1; i <= 10; ++i) {
            x_.push_back(static_cast<double>(i));
        }
    }

    std::vector<double> x_;
};

// Kernel tests cover sizes that exercise the vector body and the scalar tail
TEST_F(StatisticsTest, KernelSumMatchesScalar) {
    for (size_t size : {0u, 1u, 3u, 7u, 16u, 1001u}) {
        std::vector<double> data(size);
        std::iota(data.begin(), data.end(), 1.0);
        const double expected = static_cast<double>(size) * static_cast<double>(size + 1) / 2.0;
        EXPECT_DOUBLE_EQ(kernels::sum(data.data(), size), expected) << "size " << size;
    }
}

TEST_F(StatisticsTest, KernelDot) {
    std::vector<double> a = {1, 2, 3, 4, 5};
    std::vector<double> b = {2, 2, 2, 2, 2};
    EXPECT_DOUBLE_EQ(kernels::dot(a.data(), b.data(), a.size()), 30.0);
}

TEST_F(StatisticsTest, KernelCenteredSumSquares) {
    std::vector<double> data = {2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_DOUBLE_EQ(kernels::centered_sum_squares(data.data(), data.size(), 5.0), 32.0);
}

TEST_F(StatisticsTest, KernelCenteredCrossProduct) {
    std::vector<double> a = {1, 2, 3};
    std::vector<double> b = {3, 2, 1};
    EXPECT_DOUBLE_EQ(kernels::centered_cross_product(a.data(), b.data(), 3, 2.0, 2.0), -2.0);
}

TEST_F(StatisticsTest, Mean) {
    EXPECT_DOUBLE_EQ(mean({1, 2, 3, 4}), 2.5);
    EXPECT_TRUE(std::isnan(mean({})));
}

TEST_F(StatisticsTest, SampleVariance) {
    std::vector<double> data = {2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_NEAR(sample_variance(data), 32.0 / 7.0, 1e-12);
    EXPECT_NEAR(sample_stddev(data), std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_TRUE(std::isnan(sample_variance({1.0})));
}

TEST_F(StatisticsTest, MedianAndQuantile) {
    EXPECT_DOUBLE_EQ(median({3, 1, 2}), 2.0);
    EXPECT_DOUBLE_EQ(median({1, 2, 3, 4}), 2.5);
    EXPECT_DOUBLE_EQ(quantile({1, 2, 3, 4, 5}, 0.25), 2.0);
    EXPECT_DOUBLE_EQ(quantile({1, 2, 3, 4}, 0.25), 1.75);
    EXPECT_DOUBLE_EQ(quantile({4, 3, 2, 1}, 1.0), 4.0);
}

TEST_F(StatisticsTest, Skewness) {
    EXPECT_NEAR(skewness({1, 2, 3}), 0.0, 1e-12);
    EXPECT_NEAR(skewness({1, 2, 3, 4, 10}), 1.2 * std::sqrt(2.0), 1e-9);
    EXPECT_LT(skewness({-10, 1, 2, 3, 4}), 0.0);
}

TEST_F(StatisticsTest, SkewnessDegenerate) {
    EXPECT_TRUE(std::isnan(skewness({1, 2})));
    EXPECT_DOUBLE_EQ(skewness({5, 5, 5, 5}), 0.0);
}

TEST_F(StatisticsTest, PearsonPerfect) {
    std::vector<double> y, z;
    for (double v : x_) {
        y.push_back(2.0 * v + 1.0);
        z.push_back(-v);
    }
    EXPECT_NEAR(pearson(x_, y), 1.0, 1e-12);
    EXPECT_NEAR(pearson(x_, z), -1.0, 1e-12);
}

TEST_F(StatisticsTest, PearsonDegenerate) {
    std::vector<double> constant(x_.size(), 3.0);
    EXPECT_TRUE(std::isnan(pearson(x_, constant)));
    EXPECT_TRUE(std::isnan(pearson({1.0}, {2.0})));
}

TEST_F(StatisticsTest, LinearFit) {
    std::vector<double> x = {0, 1, 2, 3, 4};
    std::vector<double> y = {2, 5, 8, 11, 14};
    LinearFit fit = linear_fit(x, y);
    EXPECT_NEAR(fit.slope, 3.0, 1e-12);
    EXPECT_NEAR(fit.intercept, 2.0, 1e-12);

    LinearFit flat = linear_fit({1, 1, 1}, {1, 2, 3});
    EXPECT_TRUE(std::isnan(flat.slope));
}

TEST_F(StatisticsTest, Summarize) {
    NumericSummary summary = summarize({4, 1, 3, 2});
    EXPECT_EQ(summary.count, 4u);
    EXPECT_DOUBLE_EQ(summary.min, 1.0);
    EXPECT_DOUBLE_EQ(summary.max, 4.0);
    EXPECT_DOUBLE_EQ(summary.mean, 2.5);
    EXPECT_DOUBLE_EQ(summary.median, 2.5);

    NumericSummary empty = summarize({});
    EXPECT_EQ(empty.count, 0u);
    EXPECT_TRUE(std::isnan(empty.mean));
}

TEST_F(StatisticsTest, NonMissingSkipsMissingCells) {
    Column col = Column::numeric("v", {1.0, std::nan(""), 3.0});
    EXPECT_THAT(non_missing(col), ::testing::ElementsAre(1.0, 3.0));

    Column text = Column::text("t", {"a", "b"});
    EXPECT_TRUE(non_missing(text).empty());
}

TEST_F(StatisticsTest, PairedNonMissingDropsEitherSide) {
    Column a = Column::numeric("a", {1.0, std::nan(""), 3.0, 4.0});
    Column b = Column::numeric("b", {10.0, 20.0, std::nan(""), 40.0});
    auto [xs, ys] = paired_non_missing(a, b);
    EXPECT_THAT(xs, ::testing::ElementsAre(1.0, 4.0));
    EXPECT_THAT(ys, ::testing::ElementsAre(10.0, 40.0));
}

}  // namespace testing
}  // namespace autoviz
