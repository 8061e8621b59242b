/// @file tests/integration/test_scenarios.cpp
/// @brief End-to-end scenarios on the Thomas system.
///
/// These tests exercise the complete analysis path:
///   AnalysisConfig → LyapunovRun (transient + Benettin) → CtmCalculator
///   → FTLE windows → bootstrap, and ThomasIntegrator → 0-1 test
///
/// Expected values come from long reference runs of the same scheme
/// (RK4, dt = 0.005, QR every 5 steps, seed (0.1, 0, 0)):
///   b = 0.19, 20 000 steps:  λ ≈ ( 0.054,  0.015, −0.639)
///   b = 0.50, 20 000 steps:  λ ≈ (−0.344, −0.345, −0.811)  stable focus
///   b = 0.10, 100 000 steps: λ1 ≈ 0.053, every 10 000-step window chaotic
///
/// At b = 0.19 the orbit from this seed is a long chaotic transient that
/// settles onto a periodic orbit, so the robustly chaotic 0-1 and bootstrap
/// cases use b = 0.1.

#include <gtest/gtest.h>
#include "tchaos/config.hpp"
#include "tchaos/ctm.hpp"
#include "tchaos/lyapunov.hpp"
#include "tchaos/model.hpp"
#include "tchaos/statistics.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace tchaos;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Transient + analysis at the default seed, dt and QR period.
lyapunov::LyapunovRun analyzed_run(double b, std::uint64_t steps,
                                   std::uint64_t window = constants::DEFAULT_FTLE_WINDOW) {
    AnalysisConfig cfg;
    cfg.b              = b;
    cfg.analysis_steps = steps;
    cfg.window_size    = window;

    lyapunov::LyapunovRun run(cfg);
    run.run_transient(cfg.transient_steps);
    EXPECT_EQ(run.run(steps), steps);
    return run;
}

/// x sampled every `stride` steps after the default transient.
std::vector<double> sampled_x(double b, std::size_t samples, std::uint64_t stride) {
    const AnalysisConfig cfg;
    model::ThomasIntegrator integ(b, cfg.dt, cfg.seed);
    (void)integ.step_n(cfg.transient_steps);
    return model::sample_coordinate(integ, samples, stride);
}

double sum_of(const Spectrum& s) {
    return s[0] + s[1] + s[2];
}

}  // namespace

// ─── Scenario A: near-critical b = 0.19 ───────────────────────────────────────

TEST(Scenario_ChaoticNearCritical, SpectrumAndCtm) {
    constexpr double b = 0.19;
    const auto run = analyzed_run(b, constants::DEFAULT_ANALYSIS_STEPS);
    const Spectrum lambda = run.exponents();

    EXPECT_GT(lambda[0], 0.0) << "λ1=" << lambda[0];
    EXPECT_NEAR(sum_of(lambda), -3.0 * b, 0.01);
    EXPECT_NEAR(sum_of(lambda), -3.0 * b, 1e-8);
    EXPECT_TRUE(run.integrator().verify_divergence());

    const auto metrics = ctm::CtmCalculator(b).compute(lambda);
    ASSERT_TRUE(metrics.has_value());
    EXPECT_TRUE(metrics->is_finite());
    EXPECT_TRUE(metrics->is_bounded());
    EXPECT_TRUE(metrics->sum_identity.is_valid) << metrics->to_string();

    EXPECT_GT(metrics->kaplan_yorke, 2.0);
    EXPECT_LE(metrics->kaplan_yorke, 2.3);
    EXPECT_GT(metrics->ctm, 0.0);
    EXPECT_LT(metrics->ctm, 0.25);
    EXPECT_EQ(metrics->regime, ctm::Regime::ModerateChaos) << metrics->to_string();
    EXPECT_EQ(ctm::to_string(metrics->regime), "moderate-chaos");
}

TEST(Scenario_ChaoticNearCritical, TrajectoryStaysBounded) {
    constexpr double b = 0.19;
    const AnalysisConfig cfg;
    model::ThomasIntegrator integ(b, cfg.dt, cfg.seed);
    for (int i = 0; i < 50'000; ++i) {
        const auto r = integ.step();
        for (int k = 0; k < PHASE_DIM; ++k) {
            ASSERT_TRUE(std::isfinite(r.position(k)));
            ASSERT_LT(std::abs(r.position(k)), 1.0 / b + 1.0);
        }
    }
}

// ─── Scenario B: stable focus b = 0.5 ─────────────────────────────────────────

TEST(Scenario_StableFocus, AllExponentsNegative) {
    constexpr double b = 0.5;
    const auto run = analyzed_run(b, constants::DEFAULT_ANALYSIS_STEPS);

    const auto metrics = ctm::CtmCalculator(b).compute(run.exponents());
    ASSERT_TRUE(metrics.has_value());
    EXPECT_LT(metrics->lambda1, 0.0);
    EXPECT_DOUBLE_EQ(metrics->ctm, 0.0);
    EXPECT_DOUBLE_EQ(metrics->kaplan_yorke, 0.0);
    EXPECT_EQ(metrics->regime, ctm::Regime::Regular);

    EXPECT_NEAR(metrics->exponents[0], -0.344, 0.03);
    EXPECT_NEAR(metrics->exponents[1], -0.345, 0.03);
    EXPECT_NEAR(metrics->exponents[2], -0.811, 0.03);
    EXPECT_NEAR(sum_of(metrics->exponents), -1.5, 1e-8);
}

TEST(Scenario_StableFocus, ZeroOneTestIsRegular) {
    const auto series = sampled_x(0.5, 1000, 100);
    const auto r = stats::zero_one_test(series);
    EXPECT_LT(r.k, 0.1) << r.to_string();
    EXPECT_EQ(r.verdict, stats::ZeroOneVerdict::Regular);
}

// ─── Scenario C: 0-1 test on a chaotic orbit ──────────────────────────────────

TEST(Scenario_ZeroOne, ChaoticOrbitScoresNearOne) {
    const auto series = sampled_x(0.1, 3000, 1000);
    const auto r = stats::zero_one_test(series);
    EXPECT_GT(r.k, 0.9) << r.to_string();
    EXPECT_EQ(r.verdict, stats::ZeroOneVerdict::Chaotic);
    EXPECT_TRUE(r.reliable);
}

TEST(Scenario_ZeroOne, PeriodicSignalOfSameLengthScoresNearZero) {
    std::vector<double> sine(3000);
    for (std::size_t k = 0; k < sine.size(); ++k) {
        sine[k] = std::sin(0.1 * static_cast<double>(k));
    }
    const auto r = stats::zero_one_test(sine);
    EXPECT_LT(r.k, 0.1) << r.to_string();
}

// ─── Long run: FTLE windows and bootstrap ─────────────────────────────────────

TEST(Scenario_LongRun, WindowsFeedBootstrap) {
    constexpr double b = 0.1;
    const auto run = analyzed_run(b, 100'000, 10'000);
    const Spectrum lambda = run.exponents();

    EXPECT_GT(lambda[0], 0.02);
    EXPECT_LT(lambda[0], 0.1);
    EXPECT_NEAR(sum_of(lambda), -3.0 * b, 1e-8);

    const ctm::CtmCalculator strict(b, constants::SUM_IDENTITY_TOLERANCE_STRICT);
    const auto metrics = strict.compute(lambda);
    ASSERT_TRUE(metrics.has_value());
    EXPECT_TRUE(metrics->sum_identity.is_valid) << metrics->to_string();
    EXPECT_GT(metrics->kaplan_yorke, 2.0);
    EXPECT_LT(metrics->kaplan_yorke, 2.3);
    EXPECT_GT(metrics->ctm, 0.0);

    const auto windows = run.state().ftle.completed();
    ASSERT_EQ(windows.size(), 10u);

    const auto boot = stats::bootstrap_ctm(windows, b, {.num_bootstrap = 500});
    EXPECT_EQ(boot.windows, 10u);
    EXPECT_TRUE(boot.is_finite());
    EXPECT_LE(boot.ctm_stats.ci.lower, boot.ctm_stats.ci.upper);
    EXPECT_GT(boot.lambda1_stats.ci.upper, 0.0);
    EXPECT_TRUE(boot.lambda1_stats.ci.contains(boot.point_estimate.lambda1))
        << boot.to_string();

    const auto ci = stats::exponent_confidence(windows, lambda);
    EXPECT_TRUE(ci[0].ci.contains(lambda[0]));
}

// ─── Determinism ──────────────────────────────────────────────────────────────

TEST(Scenario_Determinism, IdenticalConfigsGiveIdenticalSpectra) {
    const auto a = analyzed_run(0.21, 5000);
    const auto c = analyzed_run(0.21, 5000);
    EXPECT_EQ(a.exponents(), c.exponents());
    EXPECT_TRUE(a.integrator().position() == c.integrator().position());
}
