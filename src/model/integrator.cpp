/// @file src/model/integrator.cpp
/// @brief ThomasIntegrator: owns one RK4 trajectory of the Thomas system.

#include "tchaos/model.hpp"
#include "tchaos/constants.hpp"
#include "tchaos/errors.hpp"

#include <cmath>
#include <fmt/format.h>

namespace tchaos::model {

namespace {

double checked_dt(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw ValidationError(
            fmt::format("ThomasIntegrator: dt must be finite and > 0 (got {})", dt));
    }
    return dt;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ThomasIntegrator::ThomasIntegrator(double b, double dt, std::span<const double> seed)
    : model_(b)
    , dt_(checked_dt(dt))
    , seed_(validate_seed(seed))
    , position_(seed_) {}

// ─── step ─────────────────────────────────────────────────────────────────────

StepResult ThomasIntegrator::step() noexcept {
    const Rk4Step rk = rk4_step(model_, position_, dt_);
    position_ = rk.next;
    ++step_;

    return StepResult{
        .position = position_,
        .jacobian = model_.jacobian(position_),
        .step     = step_,
        .stages   = rk.stages,
    };
}

StepResult ThomasIntegrator::step_n(std::uint64_t n) noexcept {
    if (n == 0) {
        return StepResult{
            .position = position_,
            .jacobian = model_.jacobian(position_),
            .step     = step_,
            .stages   = {position_, position_, position_, position_},
        };
    }
    StepResult last = step();
    for (std::uint64_t i = 1; i < n; ++i) {
        last = step();
    }
    return last;
}

// ─── reset / update_parameters ────────────────────────────────────────────────

void ThomasIntegrator::reset() noexcept {
    position_ = seed_;
    step_     = 0;
}

void ThomasIntegrator::reset(std::span<const double> seed) {
    seed_ = validate_seed(seed);
    reset();
}

void ThomasIntegrator::update_parameters(double b, double dt) {
    // Both checks run before anything is assigned.
    ThomasModel model(b);
    const double checked = checked_dt(dt);

    model_ = model;
    dt_    = checked;
    reset();
}

// ─── Diagnostics ──────────────────────────────────────────────────────────────

bool ThomasIntegrator::verify_divergence() const noexcept {
    const double trace = model_.jacobian(position_).trace();
    return std::abs(trace - model_.divergence()) < constants::DIVERGENCE_TOLERANCE;
}

SystemState ThomasIntegrator::state() const noexcept {
    return SystemState{
        .position = position_,
        .b        = model_.b(),
        .dt       = dt_,
        .step     = step_,
    };
}

// ─── sample_coordinate ────────────────────────────────────────────────────────

std::vector<double> sample_coordinate(ThomasIntegrator& integrator,
                                      std::size_t       samples,
                                      std::uint64_t     stride,
                                      int               axis) {
    if (axis < 0 || axis >= PHASE_DIM) {
        throw ValidationError(fmt::format("sample_coordinate: axis {} out of range", axis));
    }
    if (stride == 0) {
        throw ValidationError("sample_coordinate: stride must be >= 1");
    }

    std::vector<double> series;
    series.reserve(samples);
    for (std::size_t i = 0; i < samples; ++i) {
        const StepResult r = integrator.step_n(stride);
        series.push_back(r.position(axis));
    }
    return series;
}

} // namespace tchaos::model
