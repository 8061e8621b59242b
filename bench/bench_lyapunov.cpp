/**
 * @file  bench/bench_lyapunov.cpp
 * @brief Google Benchmark suite for the Thomas-system analysis pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Integrator_Step  one RK4 trajectory step (with stages + J)
 *   BM_Tangent_Evolve   one RK4 step of the 3×3 variational system
 *   BM_GramSchmidt      one modified Gram-Schmidt pass
 *   BM_LyapunovRun      full Benettin analysis, N steps
 *   BM_Bootstrap_Ctm    bootstrap CI over FTLE windows
 *   BM_ZeroOne_Test     0-1 test on an N-sample series
 *
 * Build (CMake):
 *   cmake --build build --target bench_lyapunov
 *   ./build/bench_lyapunov --benchmark_format=json
 *
 * Throughput units: items/second (integration steps or samples processed).
 */

#include "benchmark/benchmark.h"

#include "tchaos/config.hpp"
#include "tchaos/lyapunov.hpp"
#include "tchaos/model.hpp"
#include "tchaos/statistics.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

using namespace tchaos;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Integrator past the default transient at b = 0.19.
static model::ThomasIntegrator settled_integrator() {
    const AnalysisConfig cfg;
    model::ThomasIntegrator integ(cfg.b, cfg.dt, cfg.seed);
    (void)integ.step_n(cfg.transient_steps);
    return integ;
}

/// N synthetic FTLE windows around a chaotic spectrum with Σλ = −0.57.
static std::vector<lyapunov::FtleWindow> make_windows(std::size_t n) {
    std::vector<lyapunov::FtleWindow> w;
    w.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        const double d = 0.01 * std::sin(1.3 * static_cast<double>(k));
        w.push_back(lyapunov::FtleWindow{
            .start_step = k * 10'000,
            .end_step   = (k + 1) * 10'000,
            .exponents  = {0.05 + d, 0.0, -0.62 - d},
            .duration   = 10'000,
        });
    }
    return w;
}

// ── Single-step kernels ────────────────────────────────────────────────────────

static void BM_Integrator_Step(benchmark::State& state) {
    auto integ = settled_integrator();
    for (auto _ : state) {
        auto r = integ.step();
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Integrator_Step);

static void BM_Tangent_Evolve(benchmark::State& state) {
    auto integ = settled_integrator();
    const auto step = integ.step();
    lyapunov::TangentBasis basis = lyapunov::TangentBasis::Identity();
    for (auto _ : state) {
        basis = lyapunov::evolve_tangent_basis(basis, integ.model(), step.stages, integ.dt());
        benchmark::DoNotOptimize(basis);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Tangent_Evolve);

static void BM_GramSchmidt(benchmark::State& state) {
    lyapunov::TangentBasis v;
    v << 1.0, 0.3, -0.2,
         0.5, 1.2,  0.7,
        -0.4, 0.1,  0.9;
    for (auto _ : state) {
        auto qr = lyapunov::modified_gram_schmidt(v);
        benchmark::DoNotOptimize(qr);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_GramSchmidt);

// ── Full analysis ──────────────────────────────────────────────────────────────

static void BM_LyapunovRun(benchmark::State& state) {
    const auto steps = static_cast<std::uint64_t>(state.range(0));
    AnalysisConfig cfg;
    cfg.analysis_steps = steps;

    for (auto _ : state) {
        lyapunov::LyapunovRun run(cfg);
        run.run_transient(cfg.transient_steps);
        benchmark::DoNotOptimize(run.run(steps));
        benchmark::DoNotOptimize(run.exponents());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(steps));
    state.counters["Msteps_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(steps) / 1e6,
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_LyapunovRun)->RangeMultiplier(10)->Range(1'000, 100'000)->Unit(benchmark::kMillisecond);

// ── Statistics ─────────────────────────────────────────────────────────────────

static void BM_Bootstrap_Ctm(benchmark::State& state) {
    const auto windows = make_windows(20);
    const stats::BootstrapConfig cfg{.num_bootstrap = static_cast<std::size_t>(state.range(0))};
    for (auto _ : state) {
        auto r = stats::bootstrap_ctm(windows, 0.19, cfg);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Bootstrap_Ctm)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);

static void BM_ZeroOne_Test(benchmark::State& state) {
    auto integ = settled_integrator();
    const auto series = model::sample_coordinate(
        integ, static_cast<std::size_t>(state.range(0)), 100);
    for (auto _ : state) {
        auto r = stats::zero_one_test(series);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ZeroOne_Test)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
