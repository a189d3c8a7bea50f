/**
 * @file  bench/bench_filters.cpp
 * @brief Google Benchmark suite for the potential-field filters.
 *
 * Benchmarks
 * ----------
 *   BM_Fourier2D_RoundTrip   forward + inverse transform only
 *   BM_Continuation          exp(−H|k|) operator
 *   BM_ReductionToPole       two θ pairs per call
 *   BM_Tilt                  three spectral derivatives
 *   BM_Pseudogravity         θf·θs·|k| operator
 *
 * Build (CMake):
 *   cmake -DPOTFIELD_BUILD_BENCH=ON ..
 *   cmake --build . --target bench_filters
 *   ./bench_filters --benchmark_format=json
 *
 * Grids are square, N × N with N the benchmark argument.
 * Custom counter "Mnodes_per_sec" = grid nodes processed / 1e6.
 */

#include "benchmark/benchmark.h"

#include "potfield/filtering.hpp"
#include "potfield/fourier.hpp"

#include <cmath>
#include <cstdint>
#include <numbers>

using namespace potfield;

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

struct Survey {
    Grid x;
    Grid y;
    Grid data;
};

/// N × N survey at 50 m spacing carrying two crossing harmonics.
Survey make_survey(Eigen::Index n) {
    Survey s{Grid(n, n), Grid(n, n), Grid(n, n)};
    const double k = 2.0 * std::numbers::pi / (static_cast<double>(n) * 50.0);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            s.x(i, j) = 50.0 * static_cast<double>(i);
            s.y(i, j) = 50.0 * static_cast<double>(j);
            s.data(i, j) = 100.0 * std::sin(k * s.x(i, j)) * std::cos(2.0 * k * s.y(i, j));
        }
    }
    return s;
}

void set_node_counters(benchmark::State& state) {
    const auto nodes = static_cast<int64_t>(state.range(0)) * state.range(0);
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * nodes);
    state.counters["Mnodes_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(nodes) / 1e6,
        benchmark::Counter::kIsRate);
}

constexpr Direction FIELD{.inclination = -30.0, .declination = 10.0};
constexpr Direction POLE{.inclination = 90.0, .declination = 0.0};

} // anonymous namespace

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_Fourier2D_RoundTrip(benchmark::State& state) {
    const auto s = make_survey(state.range(0));
    for (auto _ : state) {
        auto spectrum = fourier::Fourier2D::forward(s.data);
        auto back = fourier::Fourier2D::inverse(spectrum);
        benchmark::DoNotOptimize(back.data());
    }
    set_node_counters(state);
}
BENCHMARK(BM_Fourier2D_RoundTrip)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);

static void BM_Continuation(benchmark::State& state) {
    const auto s = make_survey(state.range(0));
    for (auto _ : state) {
        auto out = filtering::continuation(s.x, s.y, s.data, 250.0);
        benchmark::DoNotOptimize(out.data());
    }
    set_node_counters(state);
}
BENCHMARK(BM_Continuation)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);

static void BM_ReductionToPole(benchmark::State& state) {
    const auto s = make_survey(state.range(0));
    for (auto _ : state) {
        auto out = filtering::reduction(s.x, s.y, s.data, FIELD, FIELD, POLE, POLE);
        benchmark::DoNotOptimize(out.data());
    }
    set_node_counters(state);
}
BENCHMARK(BM_ReductionToPole)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);

static void BM_Tilt(benchmark::State& state) {
    const auto s = make_survey(state.range(0));
    for (auto _ : state) {
        auto out = filtering::tilt(s.x, s.y, s.data);
        benchmark::DoNotOptimize(out.data());
    }
    set_node_counters(state);
}
BENCHMARK(BM_Tilt)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);

static void BM_Pseudogravity(benchmark::State& state) {
    const auto s = make_survey(state.range(0));
    for (auto _ : state) {
        auto out = filtering::pseudograv(s.x, s.y, s.data, FIELD, FIELD, 2670.0, 1.0);
        benchmark::DoNotOptimize(out.data());
    }
    set_node_counters(state);
}
BENCHMARK(BM_Pseudogravity)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);
