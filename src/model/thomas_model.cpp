/// @file src/model/thomas_model.cpp
/// @brief Thomas vector field, Jacobian and the shared RK4 stepper.

#include "tchaos/model.hpp"
#include "tchaos/errors.hpp"

#include <cmath>
#include <fmt/format.h>

namespace tchaos::model {

// ─── SystemState ──────────────────────────────────────────────────────────────

bool SystemState::is_finite() const noexcept {
    return position.allFinite() && std::isfinite(b) && std::isfinite(dt);
}

// ─── ThomasModel ──────────────────────────────────────────────────────────────

ThomasModel::ThomasModel(double b) : b_(b) {
    if (!std::isfinite(b) || b <= 0.0) {
        throw ValidationError(
            fmt::format("ThomasModel: b must be finite and > 0 (got {})", b));
    }
}

Vec3 ThomasModel::derivative(const Vec3& x) const noexcept {
    return Vec3{std::sin(x(1)) - b_ * x(0),
                std::sin(x(2)) - b_ * x(1),
                std::sin(x(0)) - b_ * x(2)};
}

Mat3 ThomasModel::jacobian(const Vec3& x) const noexcept {
    Mat3 j = -b_ * Mat3::Identity();
    j(0, 1) = std::cos(x(1));
    j(1, 2) = std::cos(x(2));
    j(2, 0) = std::cos(x(0));
    return j;
}

double ThomasModel::divergence() const noexcept {
    return -3.0 * b_;
}

// ─── rk4_step ─────────────────────────────────────────────────────────────────

Rk4Step rk4_step(const ThomasModel& model, const Vec3& x, double dt) noexcept {
    const double h = dt;

    const Vec3 s0 = x;
    const Vec3 k1 = model.derivative(s0);
    const Vec3 s1 = x + (h / 2.0) * k1;
    const Vec3 k2 = model.derivative(s1);
    const Vec3 s2 = x + (h / 2.0) * k2;
    const Vec3 k3 = model.derivative(s2);
    const Vec3 s3 = x + h * k3;
    const Vec3 k4 = model.derivative(s3);

    return Rk4Step{
        .stages = {s0, s1, s2, s3},
        .next   = x + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4),
    };
}

// ─── validate_seed ────────────────────────────────────────────────────────────

Vec3 validate_seed(std::span<const double> seed) {
    if (seed.size() != static_cast<std::size_t>(PHASE_DIM)) {
        throw ValidationError(fmt::format(
            "seed must have exactly {} components (got {})", PHASE_DIM, seed.size()));
    }
    for (double s : seed) {
        if (!std::isfinite(s)) {
            throw ValidationError("seed components must be finite");
        }
    }
    return Vec3{seed[0], seed[1], seed[2]};
}

} // namespace tchaos::model
