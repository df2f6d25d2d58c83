#pragma once

#include "types.h"
#include <cstddef>
#include <utility>
#include <vector>

namespace autoviz {

// ============================================================================
// SIMD reduction kernels (Highway, static dispatch)
// ============================================================================

namespace kernels {

double sum(const double* data, size_t count);
double dot(const double* a, const double* b, size_t count);

// sum((x - center)^2)
double centered_sum_squares(const double* data, size_t count, double center);

// sum((a - center_a) * (b - center_b))
double centered_cross_product(const double* a, const double* b, size_t count,
                              double center_a, double center_b);

}  // namespace kernels

// ============================================================================
// Descriptive statistics
// ============================================================================
//
// All functions work on already-filtered values and return NaN when the
// input cannot support the statistic (too few samples, zero variance).

struct NumericSummary {
    size_t count = 0;
    double mean = 0.0;
    double std = 0.0;
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
};

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
};

// Non-missing numeric cells of a column, in row order
std::vector<double> non_missing(const Column& column);

// Rows where both columns are present
std::pair<std::vector<double>, std::vector<double>> paired_non_missing(
    const Column& a, const Column& b);

double mean(const std::vector<double>& values);
double sample_variance(const std::vector<double>& values);
double sample_stddev(const std::vector<double>& values);
double median(std::vector<double> values);

// Linear interpolation between closest ranks, q in [0, 1]
double quantile(std::vector<double> values, double q);

// Adjusted Fisher-Pearson coefficient (G1)
double skewness(const std::vector<double>& values);

double pearson(const std::vector<double>& x, const std::vector<double>& y);

LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y);

NumericSummary summarize(const std::vector<double>& values);

}  // namespace autoviz
