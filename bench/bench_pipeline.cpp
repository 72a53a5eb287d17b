/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the ranking pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize            - cross-sectional statistics + rescale
 *   BM_Score                - category + residual scoring per stock
 *   BM_Fuse/<method>        - one fusion strategy over a batch
 *   BM_EngineRun            - full RecommendationEngine::run
 *
 * Build (CMake):
 *   cmake -DQRANK_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (stocks processed).
 */

#include "benchmark/benchmark.h"

#include "qrank/config.hpp"
#include "qrank/engine.hpp"
#include "qrank/log.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

using namespace qrank;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic synthetic Universe over the default factor keys.
static Universe make_universe(std::size_t n) {
    const auto weights = default_weight_table();
    std::mt19937_64 rng(42);
    std::normal_distribution<double> dist(0.0, 10.0);
    std::uniform_int_distribution<int> missing(0, 19);

    Universe u;
    u.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        StockFactors s;
        s.stock_id = std::to_string(600000 + i);
        for (const auto& [factor, w] : weights.factor_weights) {
            s.factors[factor] = (missing(rng) == 0) ? FactorValue{} : FactorValue{dist(rng)};
        }
        u.push_back(std::move(s));
    }
    return u;
}

static MlPredictions make_predictions(const Universe& u) {
    std::mt19937_64 rng(7);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    MlPredictions ml;
    for (const auto& s : u) {
        ml[s.stock_id] = dist(rng);
    }
    return ml;
}

static MetadataMap make_metadata(const Universe& u) {
    MetadataMap m;
    for (const auto& s : u) {
        m[s.stock_id] = StockMeta{.name = s.stock_id, .last_price = 12.5, .change_pct = 1.0};
    }
    return m;
}

// ── BM_Normalize ───────────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto u = make_universe(n);
    const FactorNormalizer normalizer;

    for (auto _ : state) {
        auto out = normalizer.normalize(u);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

// ── BM_Score ───────────────────────────────────────────────────────────────────

static void BM_Score(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto u = make_universe(n);
    const auto normalized = FactorNormalizer{}.normalize(u);
    const auto cfg = default_engine_config();
    const WeightedScorer scorer(cfg.weights, cfg.rules);

    for (auto _ : state) {
        for (const auto& s : u) {
            auto score = scorer.score(s.stock_id, normalized.by_stock.at(s.stock_id), s.factors);
            benchmark::DoNotOptimize(score);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Score)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

// ── BM_Fuse ────────────────────────────────────────────────────────────────────

static void BM_Fuse(benchmark::State& state) {
    const auto method = all_fusion_methods()[static_cast<std::size_t>(state.range(0))];
    const auto n = static_cast<std::size_t>(state.range(1));

    std::mt19937_64 rng(11);
    std::uniform_real_distribution<double> total(-3.0, 3.0);
    std::uniform_real_distribution<double> prob(0.0, 1.0);
    std::vector<FusionInput> inputs(n);
    for (std::size_t i = 0; i < n; ++i) {
        inputs[i].stock_id       = std::to_string(i);
        inputs[i].total_score    = total(rng);
        inputs[i].ml_probability = prob(rng);
    }

    const FusionEngine engine(FusionConfig{.method = method});
    for (auto _ : state) {
        auto batch = engine.fuse_all(inputs);
        benchmark::DoNotOptimize(batch);
    }
    state.SetLabel(std::string(to_string(method)));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Fuse)
    ->ArgsProduct({{0, 1, 2, 3}, {1024}})
    ->Unit(benchmark::kMicrosecond);

// ── BM_EngineRun ───────────────────────────────────────────────────────────────

static void BM_EngineRun(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto u    = make_universe(n);
    const auto ml   = make_predictions(u);
    const auto meta = make_metadata(u);

    const RecommendationEngine engine(default_engine_config());

    for (auto _ : state) {
        auto report = engine.run(u, ml, meta, Timestamp{});
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_EngineRun)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);

int main(int argc, char** argv) {
    qrank::log::set_level("warn");
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
