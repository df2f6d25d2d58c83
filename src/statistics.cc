#include "autoviz/statistics.h"
#include "hwy/highway.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace autoviz {

namespace hn = hwy::HWY_NAMESPACE;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // anonymous namespace

// ============================================================================
// Kernels
// ============================================================================

namespace kernels {

double sum(const double* data, size_t count) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    auto sum0 = hn::Zero(d);
    auto sum1 = hn::Zero(d);

    size_t i = 0;
    for (; i + 2*N <= count; i += 2*N) {
        sum0 = hn::Add(sum0, hn::LoadU(d, data + i));
        sum1 = hn::Add(sum1, hn::LoadU(d, data + i + N));
    }
    for (; i + N <= count; i += N) {
        sum0 = hn::Add(sum0, hn::LoadU(d, data + i));
    }

    double result = hn::ReduceSum(d, hn::Add(sum0, sum1));
    for (; i < count; ++i) {
        result += data[i];
    }
    return result;
}

double dot(const double* a, const double* b, size_t count) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    auto acc = hn::Zero(d);
    size_t i = 0;
    for (; i + N <= count; i += N) {
        acc = hn::MulAdd(hn::LoadU(d, a + i), hn::LoadU(d, b + i), acc);
    }

    double result = hn::ReduceSum(d, acc);
    for (; i < count; ++i) {
        result += a[i] * b[i];
    }
    return result;
}

double centered_sum_squares(const double* data, size_t count, double center) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);
    const auto c = hn::Set(d, center);

    auto acc = hn::Zero(d);
    size_t i = 0;
    for (; i + N <= count; i += N) {
        const auto diff = hn::Sub(hn::LoadU(d, data + i), c);
        acc = hn::MulAdd(diff, diff, acc);
    }

    double result = hn::ReduceSum(d, acc);
    for (; i < count; ++i) {
        const double diff = data[i] - center;
        result += diff * diff;
    }
    return result;
}

double centered_cross_product(const double* a, const double* b, size_t count,
                              double center_a, double center_b) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);
    const auto ca = hn::Set(d, center_a);
    const auto cb = hn::Set(d, center_b);

    auto acc = hn::Zero(d);
    size_t i = 0;
    for (; i + N <= count; i += N) {
        const auto da = hn::Sub(hn::LoadU(d, a + i), ca);
        const auto db = hn::Sub(hn::LoadU(d, b + i), cb);
        acc = hn::MulAdd(da, db, acc);
    }

    double result = hn::ReduceSum(d, acc);
    for (; i < count; ++i) {
        result += (a[i] - center_a) * (b[i] - center_b);
    }
    return result;
}

}  // namespace kernels

// ============================================================================
// Filtering
// ============================================================================

std::vector<double> non_missing(const Column& column) {
    std::vector<double> values;
    if (column.numbers.empty()) {
        return values;
    }
    values.reserve(column.numbers.size());
    for (size_t i = 0; i < column.numbers.size(); ++i) {
        if (!column.is_missing(i)) {
            values.push_back(column.numbers[i]);
        }
    }
    return values;
}

std::pair<std::vector<double>, std::vector<double>> paired_non_missing(
    const Column& a, const Column& b) {
    std::vector<double> xs;
    std::vector<double> ys;
    const size_t rows = std::min(a.numbers.size(), b.numbers.size());
    xs.reserve(rows);
    ys.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        if (a.is_missing(i) || b.is_missing(i)) continue;
        xs.push_back(a.numbers[i]);
        ys.push_back(b.numbers[i]);
    }
    return {std::move(xs), std::move(ys)};
}

// ============================================================================
// Descriptive statistics
// ============================================================================

double mean(const std::vector<double>& values) {
    if (values.empty()) return kNaN;
    return kernels::sum(values.data(), values.size()) / static_cast<double>(values.size());
}

double sample_variance(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) return kNaN;
    const double m = mean(values);
    return kernels::centered_sum_squares(values.data(), n, m) / static_cast<double>(n - 1);
}

double sample_stddev(const std::vector<double>& values) {
    return std::sqrt(sample_variance(values));
}

double median(std::vector<double> values) {
    return quantile(std::move(values), 0.5);
}

double quantile(std::vector<double> values, double q) {
    if (values.empty()) return kNaN;
    std::sort(values.begin(), values.end());

    const double position = q * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

double skewness(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 3) return kNaN;

    const double m = mean(values);
    double m2 = 0.0;
    double m3 = 0.0;
    for (double v : values) {
        const double diff = v - m;
        m2 += diff * diff;
        m3 += diff * diff * diff;
    }
    m2 /= static_cast<double>(n);
    m3 /= static_cast<double>(n);

    // Constant columns carry no asymmetry
    if (m2 <= std::numeric_limits<double>::epsilon() * std::max(1.0, m * m)) {
        return 0.0;
    }

    const double dn = static_cast<double>(n);
    const double g1 = m3 / std::pow(m2, 1.5);
    return g1 * std::sqrt(dn * (dn - 1.0)) / (dn - 2.0);
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return kNaN;

    const double mx = kernels::sum(x.data(), n) / static_cast<double>(n);
    const double my = kernels::sum(y.data(), n) / static_cast<double>(n);
    const double sxx = kernels::centered_sum_squares(x.data(), n, mx);
    const double syy = kernels::centered_sum_squares(y.data(), n, my);
    if (sxx <= 0.0 || syy <= 0.0) return kNaN;

    const double sxy = kernels::centered_cross_product(x.data(), y.data(), n, mx, my);
    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y) {
    LinearFit fit{kNaN, kNaN};
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return fit;

    const double mx = kernels::sum(x.data(), n) / static_cast<double>(n);
    const double my = kernels::sum(y.data(), n) / static_cast<double>(n);
    const double sxx = kernels::centered_sum_squares(x.data(), n, mx);
    if (sxx <= 0.0) return fit;

    fit.slope = kernels::centered_cross_product(x.data(), y.data(), n, mx, my) / sxx;
    fit.intercept = my - fit.slope * mx;
    return fit;
}

NumericSummary summarize(const std::vector<double>& values) {
    NumericSummary summary;
    summary.count = values.size();
    if (values.empty()) {
        summary.mean = summary.std = summary.min = summary.max = summary.median = kNaN;
        return summary;
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    summary.min = *min_it;
    summary.max = *max_it;
    summary.mean = mean(values);
    summary.std = sample_stddev(values);
    summary.median = median(values);
    return summary;
}

}  // namespace autoviz
