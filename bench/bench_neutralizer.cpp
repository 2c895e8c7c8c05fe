/**
 * @file  bench/bench_neutralizer.cpp
 * @brief Google Benchmark suite for the per-era hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_RankGaussian         : Φ⁻¹ rank transform of one column
 *   BM_NeutralizeEra        : one era, varying neutralizer count
 *   BM_NeutralizeDataset    : all eras of a dataset, 50 risky features
 *   BM_CorrelationMatrix    : per-era feature/target correlations
 *
 * Build (CMake):
 *   cmake -DERASTAT_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_neutralizer
 *   ./build/bench_neutralizer --benchmark_format=json
 *
 * Throughput units: items/second (rows processed).
 */

#include "benchmark/benchmark.h"

#include "erastat/feature_risk.hpp"
#include "erastat/neutralizer.hpp"
#include "erastat/rank_normalizer.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace erastat;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic pseudo-random value in [0, 1).
static double wave(std::size_t i, double phase) {
    const double v = std::sin(static_cast<double>(i) * 12.9898 + phase) * 43758.5453;
    return v - std::floor(v);
}

/// rows × cols matrix of binned feature-like values in {0, 0.25, .., 1}.
static Matrix make_features(Eigen::Index rows, Eigen::Index cols) {
    Matrix m(rows, cols);
    for (Eigen::Index j = 0; j < cols; ++j) {
        for (Eigen::Index i = 0; i < rows; ++i) {
            m(i, j) = std::floor(wave(static_cast<std::size_t>(i), 0.37 * static_cast<double>(j)) * 5.0) / 4.0;
        }
    }
    return m;
}

/// Dataset of `n_eras` eras × `per_era` rows with `n_features` features.
static TabularDataset make_dataset(std::size_t n_eras, std::size_t per_era, std::size_t n_features) {
    const auto rows = static_cast<Eigen::Index>(n_eras * per_era);
    std::vector<std::string> names;
    for (std::size_t f = 0; f < n_features; ++f) names.push_back("feature_" + std::to_string(f));

    LabelColumn eras;
    Column target(rows);
    Column pred(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        eras.emplace_back("era" + std::to_string(static_cast<std::size_t>(r) / per_era + 1));
        target[r] = std::floor(wave(static_cast<std::size_t>(r), 9.1) * 5.0) / 4.0;
        pred[r]   = 0.6 * target[r] + 0.4 * wave(static_cast<std::size_t>(r), 3.3);
    }

    TabularDataset ds;
    ds.set_features(std::move(names), make_features(rows, static_cast<Eigen::Index>(n_features)));
    ds.set_target("target", std::move(target));
    ds.set_labels("era", std::move(eras));
    ds.set_prediction("model", std::move(pred));
    return ds;
}

// ── Rank transform ─────────────────────────────────────────────────────────────

static void BM_RankGaussian(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const Column x = make_features(n, 1).col(0);
    for (auto _ : state) {
        Column g = RankNormalizer::gaussian(x);
        benchmark::DoNotOptimize(g.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_RankGaussian)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Neutralization ─────────────────────────────────────────────────────────────

static void BM_NeutralizeEra(benchmark::State& state) {
    constexpr Eigen::Index rows = 5000;
    const auto k = static_cast<Eigen::Index>(state.range(0));
    const Matrix exposures = make_features(rows, k);
    const Matrix scores    = make_features(rows, 1);
    const Neutralizer neutralizer;

    for (auto _ : state) {
        Matrix out = neutralizer.neutralize_era(scores, exposures, "bench");
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * rows);
}
BENCHMARK(BM_NeutralizeEra)->RangeMultiplier(2)->Range(1, 256)->Unit(benchmark::kMillisecond);

static void BM_NeutralizeDataset(benchmark::State& state) {
    const auto n_eras = static_cast<std::size_t>(state.range(0));
    const TabularDataset ds = make_dataset(n_eras, 1000, 200);
    const EraPartition eras = EraPartition::build(ds, "era");

    std::vector<std::string> risky;
    for (std::size_t f = 0; f < 50; ++f) risky.push_back("feature_" + std::to_string(f));
    const Neutralizer neutralizer;

    for (auto _ : state) {
        Matrix out = neutralizer.neutralize(ds, {"model"}, risky, eras);
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * ds.row_count());
}
BENCHMARK(BM_NeutralizeDataset)->Arg(4)->Arg(16)->Arg(64)->Unit(benchmark::kMillisecond);

// ── Feature risk ───────────────────────────────────────────────────────────────

static void BM_CorrelationMatrix(benchmark::State& state) {
    const auto n_features = static_cast<std::size_t>(state.range(0));
    const TabularDataset ds = make_dataset(20, 1000, n_features);
    const EraPartition eras = EraPartition::build(ds, "era");

    for (auto _ : state) {
        auto corrs = CorrelationMatrix::build(ds, eras);
        benchmark::DoNotOptimize(corrs.values().data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * ds.row_count());
}
BENCHMARK(BM_CorrelationMatrix)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
