/// @file src/sweep/sweep_orchestrator.cpp
/// @brief SweepOrchestrator: per-point pipeline and job bookkeeping.
///
/// run_point() pipeline for one b:
///   1. Fresh LyapunovRun from the sweep's AnalysisConfig with b substituted
///   2. Discard the transient (trajectory only)
///   3. Analysis phase, recording `checkpoints` evenly spaced snapshots
///   4. CTM of the final spectrum
///   5. Exponent CIs and, with ≥ MIN_BOOTSTRAP_WINDOWS windows, bootstrap CIs
///
/// execute() walks the grid, catches per-point exceptions, and updates job
/// status and progress after every point.

#include "tchaos/sweep.hpp"
#include "tchaos/errors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <utility>

namespace tchaos::sweep {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start) noexcept {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

PointResult failed_point(double b, std::string message) {
    PointResult r;
    r.b     = b;
    r.ok    = false;
    r.error = std::move(message);
    return r;
}

}  // namespace

// ─── Configuration ────────────────────────────────────────────────────────────

AnalysisConfig default_point_config() noexcept {
    AnalysisConfig cfg;
    cfg.analysis_steps = constants::SWEEP_ANALYSIS_STEPS;
    return cfg;
}

void SweepConfig::validate() const {
    grid.validate();

    AnalysisConfig point = analysis;
    point.b = grid.b_min;
    point.validate();
}

// ─── PointResult ──────────────────────────────────────────────────────────────

std::string PointResult::to_string() const {
    if (!ok) {
        return fmt::format("b={:.4f}  FAILED: {}", b, error);
    }
    std::string out = fmt::format(
        "b={:.4f}  λ=({:+.5f}, {:+.5f}, {:+.5f})  {}  steps={}  windows={}  {:.1f} ms",
        b, exponents[0], exponents[1], exponents[2],
        converged ? "converged" : "not converged",
        iterations, ftle_windows, elapsed_ms);
    if (metrics) {
        out += fmt::format("  CTM={:.4f} ({})", metrics->ctm, ctm::to_string(metrics->regime));
    }
    if (bootstrap) {
        out += fmt::format("  CI=[{:.4f}, {:.4f}]",
                           bootstrap->ctm_stats.ci.lower, bootstrap->ctm_stats.ci.upper);
    }
    return out;
}

std::string SweepResult::to_string() const {
    std::string out = fmt::format("sweep {}: {}/{} points in {:.1f} ms\n",
                                  sweep::to_string(status), points.size(),
                                  grid.size(), elapsed_ms);
    for (const auto& p : points) {
        out += p.to_string();
        out += '\n';
    }
    if (analysis) {
        out += analysis->to_string();
    }
    return out;
}

// ─── Construction ─────────────────────────────────────────────────────────────

SweepOrchestrator::SweepOrchestrator(SweepConfig config, PointRunner runner)
    : config_(std::move(config))
    , runner_(std::move(runner)) {
    config_.validate();
    if (!runner_) {
        runner_ = &SweepOrchestrator::run_point;
    }
}

// ─── run_point ────────────────────────────────────────────────────────────────

PointResult SweepOrchestrator::run_point(const SweepConfig&           config,
                                         double                       b,
                                         const lyapunov::CancelCheck& cancel) {
    const auto start = Clock::now();

    AnalysisConfig cfg = config.analysis;
    cfg.b = b;

    lyapunov::LyapunovRun run(cfg);
    run.run_transient(cfg.transient_steps);

    PointResult result;
    result.b = b;

    const std::uint64_t total = cfg.analysis_steps;
    const std::uint64_t checkpoint_every =
        config.checkpoints > 0 ? std::max<std::uint64_t>(1, total / config.checkpoints) : 0;
    const bool poll = cancel && config.cancel_check_interval > 0;

    for (std::uint64_t i = 1; i <= total; ++i) {
        run.step();

        if (checkpoint_every > 0 && i % checkpoint_every == 0
            && result.checkpoints.size() < config.checkpoints) {
            result.checkpoints.push_back(Checkpoint{
                .step      = i,
                .exponents = run.exponents(),
                .converged = run.is_converged(),
            });
        }

        if (poll && i % config.cancel_check_interval == 0 && cancel()) {
            result.cancelled  = true;
            result.iterations = i;
            result.elapsed_ms = elapsed_ms(start);
            return result;
        }
    }

    result.exponents  = run.exponents();
    result.converged  = run.is_converged();
    result.iterations = run.step_count();

    const ctm::CtmCalculator calc(b, cfg.sum_identity_tolerance);
    result.metrics = calc.compute(result.exponents);
    if (!result.metrics) {
        result.error      = "Lyapunov spectrum is not finite";
        result.elapsed_ms = elapsed_ms(start);
        return result;
    }

    const std::vector<lyapunov::FtleWindow> windows = run.state().ftle.completed();
    result.ftle_windows = windows.size();
    result.exponent_ci  = stats::exponent_confidence(windows, result.exponents,
                                                     cfg.confidence_level);

    if (config.compute_bootstrap && windows.size() >= constants::MIN_BOOTSTRAP_WINDOWS) {
        result.bootstrap = stats::bootstrap_ctm(windows, b, stats::BootstrapConfig{
            .num_bootstrap    = cfg.num_bootstrap,
            .confidence_level = cfg.confidence_level,
            .rng_seed         = cfg.rng_seed,
            .sum_tolerance    = cfg.sum_identity_tolerance,
        });
    }

    result.ok         = true;
    result.elapsed_ms = elapsed_ms(start);
    return result;
}

// ─── run / resume ─────────────────────────────────────────────────────────────

SweepResult SweepOrchestrator::run(SweepJob& job, const ProgressCallback& on_progress) const {
    if (job.status_ != SweepStatus::Pending) {
        throw ValidationError(fmt::format(
            "SweepOrchestrator::run: job is {}, expected pending", to_string(job.status_)));
    }

    job.grid_ = generate_grid(config_.grid);
    job.points_.clear();
    job.progress_ = 0.0;
    job.cancel_.store(false, std::memory_order_relaxed);

    return execute(job, 0, on_progress);
}

SweepResult SweepOrchestrator::resume(SweepJob&               job,
                                      double                  from_b,
                                      const ProgressCallback& on_progress) const {
    if (job.status_ != SweepStatus::Pending && job.status_ != SweepStatus::Cancelled) {
        throw ValidationError(fmt::format(
            "SweepOrchestrator::resume: job is {}, expected pending or cancelled",
            to_string(job.status_)));
    }
    if (job.grid_.empty()) {
        job.grid_ = generate_grid(config_.grid);
    }

    std::erase_if(job.points_, [from_b](const PointResult& p) { return p.b > from_b; });

    const auto first = static_cast<std::size_t>(
        std::upper_bound(job.grid_.begin(), job.grid_.end(), from_b) - job.grid_.begin());

    job.cancel_.store(false, std::memory_order_relaxed);
    return execute(job, first, on_progress);
}

// ─── execute ──────────────────────────────────────────────────────────────────

SweepResult SweepOrchestrator::execute(SweepJob&               job,
                                       std::size_t             first,
                                       const ProgressCallback& on_progress) const {
    const auto start = Clock::now();
    const std::size_t total = job.grid_.size();

    job.status_   = SweepStatus::Running;
    job.progress_ = total > 0 ? static_cast<double>(first) / static_cast<double>(total) : 1.0;

    if (config_.verbose) {
        fmt::print(stderr, "[tchaos::sweep] {} grid points, starting at index {}\n",
                   total, first);
    }

    const lyapunov::CancelCheck cancel = [&job] { return job.cancel_requested(); };
    bool cancelled = false;

    for (std::size_t i = first; i < total; ++i) {
        if (job.cancel_requested()) {
            cancelled = true;
            break;
        }

        const double b = job.grid_[i];
        PointResult point;
        try {
            point = runner_(config_, b, cancel);
        } catch (const std::exception& e) {
            point = failed_point(b, e.what());
        } catch (...) {
            job.status_ = SweepStatus::Cancelled;
            throw;
        }

        if (point.cancelled) {
            cancelled = true;
            break;
        }

        if (!point.ok) {
            fmt::print(stderr, "[tchaos::sweep] b={:.4f} failed: {}\n", b, point.error);
        } else if (config_.verbose && point.metrics) {
            fmt::print(stderr, "[tchaos::sweep] ({}/{}) b={:.4f} λ1={:+.5f} CTM={:.4f} {}\n",
                       i + 1, total, b, point.metrics->lambda1, point.metrics->ctm,
                       ctm::to_string(point.metrics->regime));
        }

        job.points_.push_back(std::move(point));
        job.progress_ = static_cast<double>(i + 1) / static_cast<double>(total);

        if (on_progress) {
            try {
                on_progress(SweepProgress{
                    .progress  = job.progress_,
                    .current_b = b,
                    .completed = i + 1,
                    .total     = total,
                    .result    = job.points_.back(),
                });
            } catch (...) {
                // Recorded points stay; the job can be resumed after them.
                job.status_ = SweepStatus::Cancelled;
                throw;
            }
        }
    }

    const bool all_failed = !job.points_.empty()
        && std::none_of(job.points_.begin(), job.points_.end(),
                        [](const PointResult& p) { return p.ok; });

    if (cancelled) {
        job.status_ = SweepStatus::Cancelled;
    } else if (all_failed) {
        job.status_ = SweepStatus::Error;
    } else {
        job.status_ = SweepStatus::Completed;
    }

    if (config_.verbose) {
        fmt::print(stderr, "[tchaos::sweep] {} after {} points\n",
                   to_string(job.status_), job.points_.size());
    }

    return SweepResult{
        .status     = job.status_,
        .grid       = job.grid_,
        .points     = job.points_,
        .analysis   = analyze(job.points_),
        .elapsed_ms = elapsed_ms(start),
    };
}

} // namespace tchaos::sweep
