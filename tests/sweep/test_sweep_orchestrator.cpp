/// @file tests/sweep/test_sweep_orchestrator.cpp
/// @brief Unit tests for SweepOrchestrator and SweepJob.
///
/// Most tests inject a cheap PointRunner so that job bookkeeping (status,
/// progress, partial failure, cancellation, resume) is exercised without
/// integrating the system. run_point() itself is tested on short runs.

#include <gtest/gtest.h>
#include "tchaos/sweep.hpp"
#include "tchaos/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tchaos;
using namespace tchaos::sweep;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Five points 0.10 … 0.30, no refinement, short per-point runs.
static SweepConfig small_config() {
    SweepConfig cfg;
    cfg.grid = GridSpec{.b_min = 0.10, .b_max = 0.30, .b_step = 0.05, .zones = {}};
    cfg.analysis.transient_steps = 500;
    cfg.analysis.analysis_steps  = 5000;
    cfg.analysis.window_size     = 500;
    return cfg;
}

/// Chaotic below b = 0.2, regular above.
static PointResult fake_point(const SweepConfig& cfg, double b) {
    PointResult r;
    r.b          = b;
    r.ok         = true;
    r.exponents  = b < 0.2 ? Spectrum{0.05, 0.0, -3.0 * b - 0.05}
                           : Spectrum{-0.1, -0.1, -3.0 * b + 0.2};
    r.converged  = true;
    r.iterations = cfg.analysis.analysis_steps;
    r.metrics    = ctm::CtmCalculator(b).compute(r.exponents);
    return r;
}

static PointResult fake_runner(const SweepConfig& cfg, double b, const lyapunov::CancelCheck&) {
    return fake_point(cfg, b);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(SweepOrchestrator_Construct, InvalidGrid_Throws) {
    SweepConfig cfg = small_config();
    cfg.grid.b_step = 0.0;
    EXPECT_THROW(SweepOrchestrator{cfg}, ValidationError);
}

TEST(SweepOrchestrator_Construct, InvalidAnalysisConfig_Throws) {
    SweepConfig cfg = small_config();
    cfg.analysis.dt = 0.0;
    EXPECT_THROW(SweepOrchestrator{cfg}, ValidationError);
}

TEST(SweepOrchestrator_Construct, DefaultPointConfigUsesLongAnalysis) {
    EXPECT_EQ(default_point_config().analysis_steps, constants::SWEEP_ANALYSIS_STEPS);
    EXPECT_EQ(SweepConfig{}.analysis.analysis_steps, constants::SWEEP_ANALYSIS_STEPS);
}

// ─── run ──────────────────────────────────────────────────────────────────────

TEST(SweepOrchestrator_Run, CompletesEveryGridPoint) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    EXPECT_EQ(job.status(), SweepStatus::Pending);

    std::vector<double> progress;
    const auto result = orch.run(job, [&](const SweepProgress& p) {
        EXPECT_EQ(job.status(), SweepStatus::Running);
        EXPECT_EQ(p.total, 5u);
        EXPECT_DOUBLE_EQ(p.current_b, p.result.b);
        progress.push_back(p.progress);
    });

    EXPECT_EQ(result.status, SweepStatus::Completed);
    EXPECT_EQ(job.status(), SweepStatus::Completed);
    EXPECT_DOUBLE_EQ(job.progress(), 1.0);
    ASSERT_EQ(result.points.size(), 5u);
    ASSERT_EQ(progress.size(), 5u);
    EXPECT_DOUBLE_EQ(progress.front(), 0.2);
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    for (std::size_t i = 0; i < result.points.size(); ++i) {
        EXPECT_DOUBLE_EQ(result.points[i].b, result.grid[i]);
    }
}

TEST(SweepOrchestrator_Run, AnalysisFindsOnsetAndTransition) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    const auto result = orch.run(job);

    ASSERT_TRUE(result.analysis.has_value());
    ASSERT_TRUE(result.analysis->chaos_onset.has_value());
    EXPECT_DOUBLE_EQ(result.analysis->chaos_onset->b, 0.10);
    ASSERT_EQ(result.analysis->transitions.size(), 1u);
    EXPECT_DOUBLE_EQ(result.analysis->transitions[0].b, 0.20);
    EXPECT_EQ(result.analysis->transitions[0].to, ctm::Regime::Regular);
}

TEST(SweepOrchestrator_Run, FailingPointIsRecordedAndSweepContinues) {
    const SweepOrchestrator orch(small_config(),
        [](const SweepConfig& cfg, double b, const lyapunov::CancelCheck&) {
            if (std::abs(b - 0.15) < 1e-12) throw std::runtime_error("integration diverged");
            return fake_point(cfg, b);
        });
    SweepJob job;
    const auto result = orch.run(job);

    EXPECT_EQ(result.status, SweepStatus::Completed);
    ASSERT_EQ(result.points.size(), 5u);
    EXPECT_FALSE(result.points[1].ok);
    EXPECT_EQ(result.points[1].error, "integration diverged");
    EXPECT_TRUE(result.points[2].ok);
    ASSERT_TRUE(result.analysis.has_value());
    EXPECT_EQ(result.analysis->statistics.failed_points, 1u);
    EXPECT_NE(result.to_string().find("FAILED: integration diverged"), std::string::npos);
}

TEST(SweepOrchestrator_Run, AllPointsFail_StatusError) {
    const SweepOrchestrator orch(small_config(),
        [](const SweepConfig&, double, const lyapunov::CancelCheck&) -> PointResult {
            throw ValidationError("bad point");
        });
    SweepJob job;
    const auto result = orch.run(job);
    EXPECT_EQ(result.status, SweepStatus::Error);
    EXPECT_EQ(result.points.size(), 5u);
    EXPECT_FALSE(result.analysis.has_value());
}

TEST(SweepOrchestrator_Run, CompletedJobIsTerminal) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    (void)orch.run(job);
    ASSERT_EQ(job.status(), SweepStatus::Completed);

    EXPECT_THROW((void)orch.run(job), ValidationError);
    EXPECT_THROW((void)orch.resume(job, 0.1), ValidationError);
    EXPECT_EQ(job.status(), SweepStatus::Completed);
    EXPECT_EQ(job.points().size(), 5u);
}

TEST(SweepOrchestrator_Run, ErrorJobIsTerminal) {
    const SweepOrchestrator orch(small_config(),
        [](const SweepConfig&, double, const lyapunov::CancelCheck&) -> PointResult {
            throw ValidationError("bad point");
        });
    SweepJob job;
    (void)orch.run(job);
    ASSERT_EQ(job.status(), SweepStatus::Error);
    EXPECT_THROW((void)orch.run(job), ValidationError);
    EXPECT_THROW((void)orch.resume(job, 0.0), ValidationError);
}

TEST(SweepOrchestrator_Run, CancelledJobCannotBeRunAgain) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    (void)orch.run(job, [&](const SweepProgress&) { job.cancel(); });
    ASSERT_EQ(job.status(), SweepStatus::Cancelled);
    EXPECT_THROW((void)orch.run(job), ValidationError);
}

TEST(SweepOrchestrator_Run, ThrowingCallbackLeavesJobResumable) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    EXPECT_THROW((void)orch.run(job, [](const SweepProgress& p) {
        if (p.completed == 3) throw std::runtime_error("listener failed");
    }), std::runtime_error);

    EXPECT_EQ(job.status(), SweepStatus::Cancelled);
    ASSERT_EQ(job.points().size(), 3u);

    const auto result = orch.resume(job, job.points().back().b);
    EXPECT_EQ(result.status, SweepStatus::Completed);
    EXPECT_EQ(result.points.size(), 5u);
}

TEST(SweepOrchestrator_Run, RunWhileRunning_Throws) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    bool checked = false;
    (void)orch.run(job, [&](const SweepProgress&) {
        if (checked) return;
        checked = true;
        EXPECT_THROW((void)orch.run(job), ValidationError);
        EXPECT_THROW((void)orch.resume(job, 0.1), ValidationError);
    });
    EXPECT_TRUE(checked);
    EXPECT_EQ(job.status(), SweepStatus::Completed);
}

// ─── Cancellation ─────────────────────────────────────────────────────────────

TEST(SweepOrchestrator_Cancel, BetweenPoints) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    const auto result = orch.run(job, [&](const SweepProgress& p) {
        if (p.completed == 2) job.cancel();
    });
    EXPECT_EQ(result.status, SweepStatus::Cancelled);
    EXPECT_EQ(result.points.size(), 2u);
    EXPECT_DOUBLE_EQ(job.progress(), 0.4);
    EXPECT_TRUE(job.cancel_requested());
}

TEST(SweepOrchestrator_Cancel, MidPointResultIsDiscarded) {
    const SweepOrchestrator orch(small_config(),
        [](const SweepConfig& cfg, double b, const lyapunov::CancelCheck&) {
            PointResult r = fake_point(cfg, b);
            if (b > 0.17) {
                r.ok        = false;
                r.cancelled = true;
            }
            return r;
        });
    SweepJob job;
    const auto result = orch.run(job);
    EXPECT_EQ(result.status, SweepStatus::Cancelled);
    EXPECT_EQ(result.points.size(), 2u);
}

TEST(SweepOrchestrator_Cancel, RunnerSeesJobCancelFlag) {
    SweepJob job;
    const SweepOrchestrator orch(small_config(),
        [&job](const SweepConfig& cfg, double b, const lyapunov::CancelCheck& cancel) {
            EXPECT_TRUE(static_cast<bool>(cancel));
            EXPECT_FALSE(cancel());
            job.cancel();
            EXPECT_TRUE(cancel());
            return fake_point(cfg, b);
        });
    const auto result = orch.run(job);
    EXPECT_EQ(result.status, SweepStatus::Cancelled);
    EXPECT_EQ(result.points.size(), 1u);
}

// ─── resume ───────────────────────────────────────────────────────────────────

TEST(SweepOrchestrator_Resume, ContinuesAfterCancel) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    (void)orch.run(job, [&](const SweepProgress& p) {
        if (p.completed == 2) job.cancel();
    });
    ASSERT_EQ(job.points().size(), 2u);

    std::vector<double> resumed;
    const auto result = orch.resume(job, job.points().back().b,
                                    [&](const SweepProgress& p) { resumed.push_back(p.current_b); });

    EXPECT_EQ(result.status, SweepStatus::Completed);
    ASSERT_EQ(result.points.size(), 5u);
    ASSERT_EQ(resumed.size(), 3u);
    EXPECT_DOUBLE_EQ(resumed.front(), 0.20);
    for (std::size_t i = 0; i < result.points.size(); ++i) {
        EXPECT_DOUBLE_EQ(result.points[i].b, result.grid[i]);
    }
}

TEST(SweepOrchestrator_Resume, DropsResultsAboveFromB) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    (void)orch.run(job, [&](const SweepProgress& p) {
        if (p.completed == 4) job.cancel();
    });
    ASSERT_EQ(job.points().size(), 4u);

    int evaluated = 0;
    const auto result = orch.resume(job, 0.2, [&](const SweepProgress&) { ++evaluated; });
    EXPECT_EQ(evaluated, 2);
    EXPECT_EQ(result.points.size(), 5u);
    EXPECT_EQ(result.status, SweepStatus::Completed);
}

TEST(SweepOrchestrator_Resume, FreshJob_GeneratesGrid) {
    const SweepOrchestrator orch(small_config(), fake_runner);
    SweepJob job;
    const auto result = orch.resume(job, 0.0);
    EXPECT_EQ(result.grid.size(), 5u);
    EXPECT_EQ(result.points.size(), 5u);
}

// ─── run_point ────────────────────────────────────────────────────────────────

TEST(SweepRunPoint, StableFocus_FullPipeline) {
    const SweepConfig cfg = small_config();
    const PointResult r = SweepOrchestrator::run_point(cfg, 0.5);

    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_FALSE(r.cancelled);
    EXPECT_EQ(r.iterations, 5000u);
    EXPECT_LT(r.exponents[0], 0.0);
    ASSERT_TRUE(r.metrics.has_value());
    EXPECT_EQ(r.metrics->regime, ctm::Regime::Regular);
    EXPECT_DOUBLE_EQ(r.metrics->ctm, 0.0);
    EXPECT_TRUE(r.metrics->sum_identity.is_valid);

    EXPECT_EQ(r.ftle_windows, 10u);
    EXPECT_TRUE(r.exponent_ci.has_value());
    ASSERT_TRUE(r.bootstrap.has_value());
    EXPECT_EQ(r.bootstrap->windows, 10u);

    ASSERT_EQ(r.checkpoints.size(), cfg.checkpoints);
    EXPECT_EQ(r.checkpoints.front().step, 500u);
    EXPECT_EQ(r.checkpoints.back().step, 5000u);
    EXPECT_EQ(r.checkpoints.back().exponents, r.exponents);
    EXPECT_GE(r.elapsed_ms, 0.0);
}

TEST(SweepRunPoint, BootstrapDisabled) {
    SweepConfig cfg = small_config();
    cfg.compute_bootstrap = false;
    const PointResult r = SweepOrchestrator::run_point(cfg, 0.5);
    ASSERT_TRUE(r.ok);
    EXPECT_FALSE(r.bootstrap.has_value());
}

TEST(SweepRunPoint, TooFewWindows_NoBootstrap) {
    SweepConfig cfg = small_config();
    cfg.analysis.window_size = 1000;
    const PointResult r = SweepOrchestrator::run_point(cfg, 0.5);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.ftle_windows, 5u);
    EXPECT_FALSE(r.bootstrap.has_value());
}

TEST(SweepRunPoint, CancelCheckStopsEarly) {
    SweepConfig cfg = small_config();
    cfg.cancel_check_interval = 100;
    const PointResult r = SweepOrchestrator::run_point(cfg, 0.5, [] { return true; });
    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.iterations, 100u);
    EXPECT_FALSE(r.metrics.has_value());
}

TEST(SweepRunPoint, InvalidB_Throws) {
    EXPECT_THROW((void)SweepOrchestrator::run_point(small_config(), -0.1), ValidationError);
}

TEST(SweepRunPoint, IndependentOfCallOrder) {
    const SweepConfig cfg = small_config();
    const PointResult a = SweepOrchestrator::run_point(cfg, 0.3);
    (void)SweepOrchestrator::run_point(cfg, 0.45);
    const PointResult b = SweepOrchestrator::run_point(cfg, 0.3);
    EXPECT_EQ(a.exponents, b.exponents);
}

// ─── Real sweep ───────────────────────────────────────────────────────────────

TEST(SweepOrchestrator_Real, SmallRegularSweep) {
    SweepConfig cfg = small_config();
    cfg.grid = GridSpec{.b_min = 0.45, .b_max = 0.55, .b_step = 0.05, .zones = {}};
    cfg.compute_bootstrap = false;

    const SweepOrchestrator orch(cfg);
    SweepJob job;
    const auto result = orch.run(job);

    EXPECT_EQ(result.status, SweepStatus::Completed);
    ASSERT_EQ(result.points.size(), 3u);
    for (const auto& p : result.points) {
        EXPECT_TRUE(p.ok) << p.to_string();
        EXPECT_NEAR(p.exponents[0] + p.exponents[1] + p.exponents[2], -3.0 * p.b, 1e-6);
    }
    ASSERT_TRUE(result.analysis.has_value());
    EXPECT_FALSE(result.analysis->chaos_onset.has_value());
    EXPECT_TRUE(result.analysis->transitions.empty());
}
