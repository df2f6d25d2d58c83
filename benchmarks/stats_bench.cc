#include <benchmark/benchmark.h>
#include "autoviz/statistics.h"
#include "hwy/aligned_allocator.h"
#include <cmath>

using namespace autoviz;

// Scalar references
namespace scalar {

double sum(const double* data, size_t count) {
    double total = 0.0;
    for (size_t i = 0; i < count; ++i) {
        total += data[i];
    }
    return total;
}

double centered_sum_squares(const double* data, size_t count, double center) {
    double total = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double d = data[i] - center;
        total += d * d;
    }
    return total;
}

}  // namespace scalar

static void fill(double* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<double>(i % 100) / 100.0;
    }
}

static void BM_ScalarSum(benchmark::State& state) {
    const size_t size = state.range(0);
    auto data = hwy::AllocateAligned<double>(size);
    fill(data.get(), size);

    for (auto _ : state) {
        double result = scalar::sum(data.get(), size);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * size * sizeof(double));
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_ScalarSum)->Range(1024, 1 << 20);

static void BM_SIMDSum(benchmark::State& state) {
    const size_t size = state.range(0);
    auto data = hwy::AllocateAligned<double>(size);
    fill(data.get(), size);

    for (auto _ : state) {
        double result = kernels::sum(data.get(), size);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * size * sizeof(double));
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_SIMDSum)->Range(1024, 1 << 20);

static void BM_ScalarCenteredSumSquares(benchmark::State& state) {
    const size_t size = state.range(0);
    auto data = hwy::AllocateAligned<double>(size);
    fill(data.get(), size);

    for (auto _ : state) {
        double result = scalar::centered_sum_squares(data.get(), size, 0.5);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * size * 3);  // sub + mul + add
}
BENCHMARK(BM_ScalarCenteredSumSquares)->Range(1024, 1 << 20);

static void BM_SIMDCenteredSumSquares(benchmark::State& state) {
    const size_t size = state.range(0);
    auto data = hwy::AllocateAligned<double>(size);
    fill(data.get(), size);

    for (auto _ : state) {
        double result = kernels::centered_sum_squares(data.get(), size, 0.5);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * size * 3);
}
BENCHMARK(BM_SIMDCenteredSumSquares)->Range(1024, 1 << 20);

static void BM_Pearson(benchmark::State& state) {
    const size_t size = state.range(0);
    std::vector<double> x(size);
    std::vector<double> y(size);
    for (size_t i = 0; i < size; ++i) {
        x[i] = static_cast<double>(i);
        y[i] = 2.0 * static_cast<double>(i) + std::sin(static_cast<double>(i));
    }

    for (auto _ : state) {
        double r = pearson(x, y);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Pearson)->Range(1024, 1 << 18);

static void BM_Skewness(benchmark::State& state) {
    const size_t size = state.range(0);
    std::vector<double> values(size);
    for (size_t i = 0; i < size; ++i) {
        values[i] = std::exp(static_cast<double>(i % 50) / 10.0);
    }

    for (auto _ : state) {
        double s = skewness(values);
        benchmark::DoNotOptimize(s);
    }

    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Skewness)->Range(1024, 1 << 18);

BENCHMARK_MAIN();
