#pragma once

/// @file include/tchaos/model.hpp
/// @brief Thomas dynamical model and fixed-step RK4 trajectory integrator.
///
/// # Module: Dynamical Model & Trajectory Integrator
///
/// ## Responsibility
/// Define the cyclically symmetric Thomas system
///
///     ẋ = sin(y) − b·x
///     ẏ = sin(z) − b·y
///     ż = sin(x) − b·z
///
/// its Jacobian
///
///         ┌ −b      cos y   0     ┐
///     J = │ 0       −b      cos z │
///         └ cos x   0       −b    ┘
///
/// and advance a trajectory with the classical 4th-order Runge-Kutta scheme.
///
/// ## Guarantees
/// - trace(J) = −3b at every point: phase-space volume contracts at the
///   constant rate 3b, so Σλ = −3b.
/// - Construction validates b, dt and the seed; nothing is clamped.
/// - Deterministic: identical (b, dt, seed, steps) give bit-identical states.
/// - Value semantics: copying an integrator copies the whole run state.
///
/// ## NOT Responsible For
/// - Tangent-space evolution (see src/lyapunov/)
/// - Chaos metrics (see src/ctm/)

#include "tchaos/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tchaos::model {

// ─── SystemState ──────────────────────────────────────────────────────────────

/// A point in phase space together with the parameters that own it.
struct SystemState {
    Vec3          position;  ///< (x, y, z)
    double        b;         ///< Dissipation parameter
    double        dt;        ///< Integration step
    std::uint64_t step;      ///< Steps taken since the last reset

    /// True iff the position and both parameters are finite.
    [[nodiscard]] bool is_finite() const noexcept;
};

// ─── StepResult ───────────────────────────────────────────────────────────────

/// Output of one trajectory step.
struct StepResult {
    Vec3          position;  ///< State after the step
    Mat3          jacobian;  ///< J evaluated at `position`
    std::uint64_t step;      ///< 1-based index of the step just taken

    /// Trajectory positions at which the four RK4 slopes were evaluated:
    /// x, x + h/2·k1, x + h/2·k2, x + h·k3. The variational integrator
    /// evaluates J at the same points.
    std::array<Vec3, 4> stages;
};

// ─── ThomasModel ──────────────────────────────────────────────────────────────

/// The vector field and its linearization for a fixed b.
class ThomasModel {
public:
    /// # Throws
    /// `ValidationError` if b is not a finite, strictly positive number.
    explicit ThomasModel(double b);

    /// f(x) = (sin y − bx, sin z − by, sin x − bz).
    [[nodiscard]] Vec3 derivative(const Vec3& x) const noexcept;

    /// ∂f/∂x at x.
    [[nodiscard]] Mat3 jacobian(const Vec3& x) const noexcept;

    /// Constant divergence ∇·f = trace(J) = −3b.
    [[nodiscard]] double divergence() const noexcept;

    [[nodiscard]] double b() const noexcept { return b_; }

private:
    double b_;
};

// ─── RK4 ──────────────────────────────────────────────────────────────────────

/// One RK4 step: the stage positions and the resulting state.
struct Rk4Step {
    std::array<Vec3, 4> stages;  ///< Evaluation points of k1..k4
    Vec3                next;    ///< x + h/6·(k1 + 2k2 + 2k3 + k4)
};

/// Advance x by one classical RK4 step of size dt.
[[nodiscard]] Rk4Step rk4_step(const ThomasModel& model,
                               const Vec3&        x,
                               double             dt) noexcept;

/// Convert a caller-supplied seed into a phase-space point.
///
/// # Throws
/// `ValidationError` unless `seed` holds exactly 3 finite values.
[[nodiscard]] Vec3 validate_seed(std::span<const double> seed);

// ─── ThomasIntegrator ─────────────────────────────────────────────────────────

/// Owns one trajectory of the Thomas system.
///
/// # Example
/// ```cpp
/// const std::array<double, 3> seed{0.1, 0.0, 0.0};
/// tchaos::model::ThomasIntegrator integ(0.19, 0.005, seed);
/// integ.step_n(2000);                  // discard transient
/// auto r = integ.step();               // r.position, r.jacobian, r.step
/// ```
class ThomasIntegrator {
public:
    /// # Throws
    /// `ValidationError` for non-positive / non-finite b or dt, or a seed
    /// that is not exactly 3 finite reals.
    ThomasIntegrator(double b, double dt, std::span<const double> seed);

    /// Advance one RK4 step.
    StepResult step() noexcept;

    /// Advance `n` steps and return the last result (the current state with
    /// no stages advanced if n = 0).
    StepResult step_n(std::uint64_t n) noexcept;

    /// Restore the stored seed and zero the step counter.
    void reset() noexcept;

    /// Store and restore a new seed.
    ///
    /// # Throws
    /// `ValidationError` for a malformed seed; the integrator is unchanged.
    void reset(std::span<const double> seed);

    /// Replace b and dt, then perform a full reset.
    ///
    /// # Throws
    /// `ValidationError` if either value is invalid; the integrator is
    /// unchanged.
    void update_parameters(double b, double dt);

    /// Model self-test: |trace(J(x)) + 3b| < DIVERGENCE_TOLERANCE at the
    /// current position.
    [[nodiscard]] bool verify_divergence() const noexcept;

    /// Copy of the current state.
    [[nodiscard]] SystemState state() const noexcept;

    [[nodiscard]] const Vec3&        position() const noexcept { return position_; }
    [[nodiscard]] const ThomasModel& model()    const noexcept { return model_; }
    [[nodiscard]] double             b()        const noexcept { return model_.b(); }
    [[nodiscard]] double             dt()       const noexcept { return dt_; }
    [[nodiscard]] std::uint64_t      step_index() const noexcept { return step_; }

private:
    ThomasModel   model_;
    double        dt_;
    Vec3          seed_;
    Vec3          position_;
    std::uint64_t step_ = 0;
};

// ─── Observables ──────────────────────────────────────────────────────────────

/// Record one coordinate of the trajectory every `stride` steps.
///
/// Advances `integrator` by samples·stride steps. Used to feed the 0-1 test
/// with a series sampled coarsely enough to avoid oversampling the flow.
///
/// # Throws
/// `ValidationError` if `axis` ∉ {0, 1, 2} or `stride` = 0.
[[nodiscard]] std::vector<double> sample_coordinate(ThomasIntegrator& integrator,
                                                    std::size_t       samples,
                                                    std::uint64_t     stride,
                                                    int               axis = 0);

} // namespace tchaos::model
