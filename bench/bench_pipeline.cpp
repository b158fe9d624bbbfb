/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for feature assembly and model training.
 *
 * Benchmarks
 * ----------
 *   BM_GeoIndex_Nearest       : nearest-POI query through the spatial hash
 *   BM_GeoIndex_CountWithin   : radius count
 *   BM_AmenityParse           : braced amenity list parse
 *   BM_Assemble               : all engines, by listing count
 *   BM_Assemble_Workers       : fixed batch, by worker count
 *   BM_Fit_Ridge / Forest / Boosting
 *
 * Build (CMake):
 *   cmake -DSTRP_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (listings or queries processed).
 */

#include "benchmark/benchmark.h"

#include "strp/amenity.hpp"
#include "strp/assembler.hpp"
#include "strp/geo.hpp"
#include "strp/orchestrator.hpp"
#include "strp/regressor.hpp"
#include "strp/sample_data.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static strp::core::SampleCity make_city(std::size_t listings, std::size_t pois_per_category = 20) {
    return strp::core::SampleCityGenerator(
               strp::core::SampleCityConfig{.listings = listings, .pois_per_category = pois_per_category})
        .generate();
}

static strp::FeatureConfig bench_config(std::size_t workers) {
    strp::FeatureConfig cfg;
    cfg.temporal.reference_date = std::chrono::year{2024} / std::chrono::June / 30;
    cfg.worker_threads          = workers;
    return cfg;
}

/// Query points scattered over the sample city.
static std::vector<strp::Coordinates> make_queries(std::size_t n) {
    std::mt19937_64 rng(3);
    std::uniform_real_distribution<double> d(-0.05, 0.05);
    std::vector<strp::Coordinates> q(n);
    for (auto& c : q) c = {-22.97 + d(rng), -43.19 + d(rng)};
    return q;
}

// ── Geospatial queries ─────────────────────────────────────────────────────────

static void BM_GeoIndex_Nearest(benchmark::State& state) {
    const auto city    = make_city(1, static_cast<std::size_t>(state.range(0)));
    const strp::geo::GeoIndex index(city.pois);
    const auto queries = make_queries(1024);
    std::size_t i = 0;
    for (auto _ : state) {
        const double d = index.nearest_distance(queries[i++ & 1023], strp::PoiCategory::Beach);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_GeoIndex_Nearest)->RangeMultiplier(4)->Range(4, 1024);

static void BM_GeoIndex_CountWithin(benchmark::State& state) {
    const auto city    = make_city(1, static_cast<std::size_t>(state.range(0)));
    const strp::geo::GeoIndex index(city.pois);
    const auto queries = make_queries(1024);
    std::size_t i = 0;
    for (auto _ : state) {
        const auto n = index.count_within(queries[i++ & 1023], strp::PoiCategory::Restaurant, 1.0);
        benchmark::DoNotOptimize(n);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_GeoIndex_CountWithin)->RangeMultiplier(4)->Range(4, 1024);

// ── Amenity parsing ────────────────────────────────────────────────────────────

static void BM_AmenityParse(benchmark::State& state) {
    const std::string raw =
        R"({TV,"Cable TV",Wifi,"Air conditioning",Kitchen,"Free parking on premises",)"
        R"(Pool,Gym,"Hot tub","Laptop friendly workspace",Washer,Dryer,Essentials})";
    for (auto _ : state) {
        auto parsed = strp::features::parse_amenities(raw);
        benchmark::DoNotOptimize(parsed);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(raw.size()));
}
BENCHMARK(BM_AmenityParse);

// ── Feature assembly ───────────────────────────────────────────────────────────

static void BM_Assemble(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto city = make_city(n);
    const auto assembler = strp::features::FeatureAssembler::from_config(city.pois, bench_config(0));
    if (!assembler) {
        state.SkipWithError(assembler.error().to_string().c_str());
        return;
    }
    for (auto _ : state) {
        auto m = assembler->assemble(city.listings);
        benchmark::DoNotOptimize(m.values().data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Assemble)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

static void BM_Assemble_Workers(benchmark::State& state) {
    const auto city = make_city(8192);
    const auto assembler = strp::features::FeatureAssembler::from_config(
        city.pois, bench_config(static_cast<std::size_t>(state.range(0))));
    if (!assembler) {
        state.SkipWithError(assembler.error().to_string().c_str());
        return;
    }
    for (auto _ : state) {
        auto m = assembler->assemble(city.listings);
        benchmark::DoNotOptimize(m.values().data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 8192);
}
BENCHMARK(BM_Assemble_Workers)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);

// ── Regressor fitting ──────────────────────────────────────────────────────────

/// Training block from an assembled sample city, target = price.
struct TrainingBlock {
    strp::RowMatrix X;
    Eigen::VectorXd y;
};

static TrainingBlock make_training_block(std::size_t n) {
    const auto city = make_city(n);
    const auto m    = strp::features::FeatureAssembler::from_config(city.pois, bench_config(0))
                          ->assemble(city.listings);
    std::vector<std::string> features;
    for (const auto& c : m.columns()) {
        if (c.name != "price") features.push_back(c.name);
    }
    return TrainingBlock{m.select_columns(features).values(), *m.column("price")};
}

static void fit_bench(benchmark::State& state, strp::RegressorSpec spec) {
    const auto block     = make_training_block(static_cast<std::size_t>(state.range(0)));
    const auto regressor = strp::models::make_regressor(spec);
    for (auto _ : state) {
        auto fitted = regressor->fit(block.X, block.y);
        benchmark::DoNotOptimize(fitted);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

static void BM_Fit_Ridge(benchmark::State& state) {
    fit_bench(state, {.name = "ridge", .kind = strp::RegressorKind::Ridge, .params = {}});
}
BENCHMARK(BM_Fit_Ridge)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMillisecond);

static void BM_Fit_Forest(benchmark::State& state) {
    strp::RegressorSpec spec{.name = "forest", .kind = strp::RegressorKind::RandomForest, .params = {}};
    spec.params.n_estimators = 50;
    fit_bench(state, spec);
}
BENCHMARK(BM_Fit_Forest)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMillisecond);

static void BM_Fit_Boosting(benchmark::State& state) {
    strp::RegressorSpec spec{.name = "boosting", .kind = strp::RegressorKind::GradientBoosting,
                             .params = {}};
    spec.params.n_estimators = 100;
    fit_bench(state, spec);
}
BENCHMARK(BM_Fit_Boosting)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
