/// @file src/lyapunov/lyapunov_run.cpp
/// @brief LyapunovState, the per-step `advance` pipeline and LyapunovRun.
///
/// advance() is the single place where the tangent-space components meet:
///   evolve basis → count step → (every qr_period) QR + accumulate
///   → roll FTLE window → (every check interval) convergence snapshot

#include "tchaos/lyapunov.hpp"
#include "tchaos/errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace tchaos::lyapunov {

// ─── LyapunovState ────────────────────────────────────────────────────────────

LyapunovState::LyapunovState(const AnalysisConfig& config)
    : accumulator(config.dt)
    , convergence(config.min_convergence_steps, config.tolerance)
    , ftle(config.window_size, config.dt) {}

// ─── advance ──────────────────────────────────────────────────────────────────

std::optional<RenormalizationSnapshot>
advance(LyapunovState&            state,
        const model::ThomasModel& model,
        const model::StepResult&  step,
        const AnalysisConfig&     config) noexcept {
    state.basis = evolve_tangent_basis(state.basis, model, step.stages, config.dt);
    state.accumulator.count_step();

    const std::uint64_t n = state.accumulator.step_count();
    bool renormalized = false;

    if (n % config.qr_period == 0) {
        const QrResult qr = modified_gram_schmidt(state.basis);
        state.basis = qr.q;
        state.accumulator.accumulate(qr.log_growth);
        state.ftle.accumulate(qr.log_growth);
        ++state.qr_count;
        renormalized = true;
    }

    state.ftle.on_step(n);

    if (n % config.convergence_check_interval == 0) {
        state.convergence.record(n, state.accumulator.exponents());
    }

    if (!renormalized) return std::nullopt;

    return RenormalizationSnapshot{
        .exponents    = state.accumulator.exponents(),
        .is_converged = state.convergence.is_converged(),
        .step_count   = n,
    };
}

// ─── LyapunovRun ──────────────────────────────────────────────────────────────

namespace {

AnalysisConfig validated(AnalysisConfig config) {
    config.validate();
    return config;
}

}  // namespace

LyapunovRun::LyapunovRun(AnalysisConfig config)
    : config_(validated(std::move(config)))
    , integrator_(config_.b, config_.dt, config_.seed)
    , lyapunov_(config_) {}

void LyapunovRun::run_transient(std::uint64_t steps) noexcept {
    for (std::uint64_t i = 0; i < steps; ++i) {
        integrator_.step();
    }
}

std::optional<RenormalizationSnapshot> LyapunovRun::step() noexcept {
    const model::StepResult r = integrator_.step();
    return advance(lyapunov_, integrator_.model(), r, config_);
}

std::uint64_t LyapunovRun::run(std::uint64_t      steps,
                               const CancelCheck& cancel,
                               std::uint64_t      cancel_interval) {
    const bool poll = cancel && cancel_interval > 0;

    for (std::uint64_t i = 1; i <= steps; ++i) {
        step();
        if (poll && i % cancel_interval == 0 && cancel()) {
            return i;
        }
    }
    return steps;
}

Spectrum LyapunovRun::exponents() const noexcept {
    return lyapunov_.accumulator.exponents();
}

bool LyapunovRun::is_converged() const noexcept {
    return lyapunov_.convergence.is_converged();
}

std::uint64_t LyapunovRun::step_count() const noexcept {
    return lyapunov_.accumulator.step_count();
}

RunSnapshot LyapunovRun::snapshot() const {
    return RunSnapshot{integrator_, lyapunov_};
}

void LyapunovRun::restore(RunSnapshot snapshot) {
    if (snapshot.integrator.b() != config_.b || snapshot.integrator.dt() != config_.dt) {
        throw ValidationError(fmt::format(
            "LyapunovRun::restore: snapshot (b={}, dt={}) does not match run (b={}, dt={})",
            snapshot.integrator.b(), snapshot.integrator.dt(), config_.b, config_.dt));
    }
    integrator_ = std::move(snapshot.integrator);
    lyapunov_   = std::move(snapshot.lyapunov);
}

void LyapunovRun::reset() {
    integrator_.reset();
    lyapunov_ = LyapunovState(config_);
}

} // namespace tchaos::lyapunov
