/**
 * @file  bench/bench_growth.cpp
 * @brief Google Benchmark suite for growth projection and blended IRR.
 *
 * Benchmarks
 * ----------
 *   BM_GrowthPoints              : plain monthly series, horizon swept
 *   BM_GrowthWithFollowOns       : overlay cost, follow-on count swept
 *   BM_BlendedIrr                : sort + proceeds loop, follow-on count swept
 *   BM_PortfolioBlendedGrowth    : pooled batches with overlays
 *   BM_EngineCalculate_Blended   : full dispatch including growth
 *
 * Build (CMake):
 *   cmake -DIRRKIT_BENCH=ON ..
 *   cmake --build build --target bench_growth
 *   ./build/bench_growth --benchmark_format=json
 *
 * Throughput units: items/second (growth points or follow-ons processed).
 */

#include "benchmark/benchmark.h"

#include "irrkit/blended.hpp"
#include "irrkit/calendar.hpp"
#include "irrkit/engine.hpp"
#include "irrkit/growth.hpp"

#include <cstddef>
#include <vector>

using namespace irrkit;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const Date kBase = calendar::make_date(2020, 1, 1);

/// n follow-ons spread over the first ten years, cycling through every kind.
static std::vector<FollowOnInvestment> make_follow_ons(std::size_t n) {
    std::vector<FollowOnInvestment> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        FollowOnSpec spec{
            .timing          = RelativeTiming{static_cast<double>((i * 37) % 3650),
                                              TimeUnit::Days},
            .investment_type = static_cast<InvestmentType>(i % 3),
            .amount          = 1000.0 + static_cast<double>(i),
        };
        if (i % 4 == 1) {
            spec.valuation_mode = ValuationMode::Custom;
            spec.valuation_type = ValuationType::Specified;
            spec.valuation      = 1500.0;
        } else if (i % 4 == 2) {
            spec.valuation_mode = ValuationMode::Custom;
            spec.valuation_type = ValuationType::Computed;
            spec.custom_irr     = 0.18;
        }
        out.push_back(FollowOnInvestment::make(spec, kBase).value());
    }
    return out;
}

// ── Plain growth ───────────────────────────────────────────────────────────────

static void BM_GrowthPoints(benchmark::State& state) {
    const double years = static_cast<double>(state.range(0));
    for (auto _ : state) {
        auto series = growth::growth_points(10000.0, 0.12, years);
        benchmark::DoNotOptimize(series.data());
    }
    state.SetItemsProcessed(state.iterations()
                            * (growth::total_months(years) + 1));
}
BENCHMARK(BM_GrowthPoints)->Arg(1)->Arg(10)->Arg(50)->Arg(1000);

// ── Follow-on overlays ─────────────────────────────────────────────────────────

static void BM_GrowthWithFollowOns(benchmark::State& state) {
    const auto events = make_follow_ons(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto series = growth::growth_points_with_follow_ons(
            10000.0, 0.12, 10.0, events, kBase);
        benchmark::DoNotOptimize(series.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_GrowthWithFollowOns)->RangeMultiplier(4)->Range(1, 256);

static void BM_BlendedIrr(benchmark::State& state) {
    const auto events = make_follow_ons(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            blended::blended_irr(10000.0, 45000.0, 10.0, events, kBase));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BlendedIrr)->RangeMultiplier(4)->Range(1, 4096);

// ── Portfolio ──────────────────────────────────────────────────────────────────

static void BM_PortfolioBlendedGrowth(benchmark::State& state) {
    const PortfolioUnitBatch initial{10000.0, 100.0, kBase};
    std::vector<PortfolioUnitBatch> batches;
    for (long i = 0; i < state.range(0); ++i) {
        batches.push_back({500.0, 100.0 + static_cast<double>(i),
                           calendar::add_days(kBase, 30 * (i + 1))});
    }
    const portfolio::UnitTerms terms{40.0, 600.0, 80.0, 5.0};

    for (auto _ : state) {
        auto series = growth::portfolio_blended_growth_points(
            initial, batches, terms, 8.0, kBase);
        benchmark::DoNotOptimize(series.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PortfolioBlendedGrowth)->RangeMultiplier(4)->Range(1, 64);

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_EngineCalculate_Blended(benchmark::State& state) {
    const core::Engine engine;
    const core::BlendedIrrRequest request{
        10000.0, 45000.0, 10.0, make_follow_ons(16), kBase};
    const core::CalculationRequest wrapped{request};
    for (auto _ : state) {
        auto result = engine.calculate(wrapped);
        benchmark::DoNotOptimize(result.value);
    }
}
BENCHMARK(BM_EngineCalculate_Blended);

BENCHMARK_MAIN();
