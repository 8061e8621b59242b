#pragma once

/// @file include/tchaos/lyapunov.hpp
/// @brief Benettin QR method for the Lyapunov spectrum: public API.
///
/// # Module: Tangent-Space Evolver, QR Renormalizer, Convergence & FTLE
///
/// ## Responsibility
/// Evolve an orthonormal tangent basis alongside a Thomas trajectory, extract
/// exponential growth rates by periodic modified Gram-Schmidt, and keep the
/// bookkeeping needed by the statistics layer:
///   - `evolve_tangent_basis`: RK4 on dV/dt = J(x(t))·V
///   - `modified_gram_schmidt`: V = Q·R with R_ii floored at 1e-10
///   - `LyapunovAccumulator`: running Σ ln R_ii per axis
///   - `ConvergenceMonitor`: sliding window of exponent snapshots
///   - `FtleWindowManager`: ring buffer of finite-time estimates
///   - `LyapunovState` + `advance`: the whole run state as one value
///   - `LyapunovRun`: owns a trajectory and a `LyapunovState`
///
/// ## Algorithm
/// With V₀ = I and Φ(t) the tangent propagator, every `qr_period` steps
///
///     V ← Φ·V = Q·R,   S_i += ln R_ii,   V ← Q
///
/// and λ_i ≈ S_i / (steps·dt). Because trace(J) = −3b,
/// Σ_i ln R_ii = ln det Φ = −3b·t exactly, up to the RK4 truncation of the
/// variational equation.
///
/// ## Guarantees
/// - The tangent basis is advanced with the same RK4 stages as the
///   trajectory (both fourth order).
/// - Immediately after every QR pass the basis is orthonormal.
/// - `LyapunovState` is a plain value: copying it is a deep copy.
/// - Convergence is advisory; it never stops a run.
///
/// ## NOT Responsible For
/// - CTM / Kaplan-Yorke (see src/ctm/)
/// - Bootstrap confidence intervals (see src/statistics/)

#include "tchaos/config.hpp"
#include "tchaos/model.hpp"
#include "tchaos/types.hpp"
#include "tchaos/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace tchaos::lyapunov {

/// Columns are the tangent vectors v_0, v_1, v_2.
using TangentBasis = Mat3;

// ─── Tangent-Space Evolver ────────────────────────────────────────────────────

/// Advance every column of `basis` by one RK4 step of dV/dt = J·V, with J
/// evaluated at the RK4 stage positions of the matching trajectory step:
///
///     K1 = J(s0)·V
///     K2 = J(s1)·(V + h/2·K1)
///     K3 = J(s2)·(V + h/2·K2)
///     K4 = J(s3)·(V + h·K3)
///     V' = V + h/6·(K1 + 2K2 + 2K3 + K4)
[[nodiscard]] TangentBasis
evolve_tangent_basis(const TangentBasis&        basis,
                     const model::ThomasModel&  model,
                     const std::array<Vec3, 4>& stages,
                     double                     dt) noexcept;

// ─── QR Renormalizer ──────────────────────────────────────────────────────────

/// Result of one modified Gram-Schmidt pass: basis = q·r.
struct QrResult {
    TangentBasis q;           ///< Orthonormalized columns
    Mat3         r;           ///< Upper-triangular factor (floored diagonal)
    Spectrum     log_growth;  ///< ln|r(i,i)| per axis
};

/// Orthonormalize the columns of `basis` in order 0, 1, 2.
///
/// For column i the projections onto q_0..q_{i−1} are removed one at a time
/// from the running residual (modified variant), the projection coefficients
/// go to r(j, i), and r(i, i) = max(‖residual‖, floor).
[[nodiscard]] QrResult
modified_gram_schmidt(const TangentBasis& basis,
                      double floor = constants::QR_DIAGONAL_FLOOR) noexcept;

/// max |(QᵀQ − I)_ij|, zero for a perfectly orthonormal basis.
[[nodiscard]] double orthonormality_error(const TangentBasis& basis) noexcept;

// ─── LyapunovAccumulator ──────────────────────────────────────────────────────

/// Running per-axis log-growth sums over the whole analysis phase.
class LyapunovAccumulator {
public:
    explicit LyapunovAccumulator(double dt) noexcept;

    /// Add one QR pass worth of ln R_ii.
    void accumulate(const Spectrum& log_growth) noexcept;

    /// Count one integration step.
    void count_step() noexcept { ++step_count_; }

    /// λ_i = S_i / (steps·dt); all zeros before the first step.
    [[nodiscard]] Spectrum exponents() const noexcept;

    [[nodiscard]] const Spectrum& sums()       const noexcept { return sums_; }
    [[nodiscard]] std::uint64_t   step_count() const noexcept { return step_count_; }
    [[nodiscard]] double          dt()         const noexcept { return dt_; }

    void reset() noexcept;

private:
    double        dt_;
    Spectrum      sums_{};
    std::uint64_t step_count_ = 0;
};

// ─── ConvergenceMonitor ───────────────────────────────────────────────────────

/// One recorded exponent estimate.
struct ConvergenceSnapshot {
    std::uint64_t step;
    Spectrum      exponents;
};

/// Declares convergence once the exponent estimates stop moving.
///
/// Keeps the newest CONVERGENCE_HISTORY snapshots. With a full history and
/// at least `min_steps` steps, the mean of the newest CONVERGENCE_HALF_WINDOW
/// snapshots is compared with the mean of the ones before them; the run is
/// converged iff the largest per-axis difference is below `tolerance`.
class ConvergenceMonitor {
public:
    ConvergenceMonitor(std::uint64_t min_steps, double tolerance) noexcept;

    /// Append a snapshot and re-evaluate. Returns the new verdict.
    bool record(std::uint64_t step, const Spectrum& exponents) noexcept;

    [[nodiscard]] bool is_converged() const noexcept { return converged_; }

    /// Last evaluated spread, or nullopt before the history first fills.
    [[nodiscard]] std::optional<double> spread() const noexcept { return spread_; }

    [[nodiscard]] const std::deque<ConvergenceSnapshot>& history() const noexcept {
        return history_;
    }

    void reset() noexcept;

private:
    std::uint64_t                   min_steps_;
    double                          tolerance_;
    std::deque<ConvergenceSnapshot> history_;
    std::optional<double>           spread_;
    bool                            converged_ = false;
};

// ─── FtleWindowManager ────────────────────────────────────────────────────────

/// One closed finite-time window.
struct FtleWindow {
    std::uint64_t start_step;  ///< Step count when the window opened
    std::uint64_t end_step;    ///< Step count when it closed
    Spectrum      exponents;   ///< Window-local Σ ln R_ii / (duration·dt)
    std::uint64_t duration;    ///< end_step − start_step

    [[nodiscard]] bool is_finite() const noexcept;
};

/// The window currently accumulating.
struct OpenWindow {
    std::uint64_t start_step;
    Spectrum      sums;
};

/// Buffers approximately independent finite-time exponent estimates.
///
/// A window opens at step 0 (and again every time one closes), collects only
/// the log-growth of QR passes inside its own interval, and closes after
/// `window_size` steps. The newest `capacity` windows are kept.
class FtleWindowManager {
public:
    FtleWindowManager(std::uint64_t window_size,
                      double        dt,
                      std::size_t   capacity = constants::FTLE_BUFFER_CAPACITY) noexcept;

    /// Add one QR pass worth of ln R_ii to the open window.
    void accumulate(const Spectrum& log_growth) noexcept;

    /// Close the open window if `step` reached its end, then open the next.
    /// Returns true if a window was closed.
    bool on_step(std::uint64_t step) noexcept;

    [[nodiscard]] const std::deque<FtleWindow>& windows() const noexcept {
        return windows_;
    }

    /// Copy of the closed windows, oldest first.
    [[nodiscard]] std::vector<FtleWindow> completed() const;

    [[nodiscard]] const OpenWindow& open_window() const noexcept { return open_; }
    [[nodiscard]] std::size_t       size()        const noexcept { return windows_.size(); }
    [[nodiscard]] std::uint64_t     window_size() const noexcept { return window_size_; }
    [[nodiscard]] std::size_t       capacity()    const noexcept { return capacity_; }

    void reset() noexcept;

private:
    std::uint64_t          window_size_;
    double                 dt_;
    std::size_t            capacity_;
    OpenWindow             open_{0, {}};
    std::deque<FtleWindow> windows_;
};

// ─── LyapunovState ────────────────────────────────────────────────────────────

/// Emitted after every QR pass.
struct RenormalizationSnapshot {
    Spectrum      exponents;
    bool          is_converged;
    std::uint64_t step_count;
};

/// Complete tangent-space state of one run. Copy to persist; never share.
struct LyapunovState {
    explicit LyapunovState(const AnalysisConfig& config);

    TangentBasis        basis = TangentBasis::Identity();
    LyapunovAccumulator accumulator;
    ConvergenceMonitor  convergence;
    FtleWindowManager   ftle;
    std::uint64_t       qr_count = 0;
};

/// Advance `state` by the trajectory step `step`:
///   1. evolve the tangent basis with the step's RK4 stages,
///   2. count the step,
///   3. every `qr_period` steps renormalize and accumulate,
///   4. roll FTLE windows,
///   5. every `convergence_check_interval` steps record a snapshot.
///
/// Returns the renormalization snapshot when step 3 ran.
std::optional<RenormalizationSnapshot>
advance(LyapunovState&            state,
        const model::ThomasModel& model,
        const model::StepResult&  step,
        const AnalysisConfig&     config) noexcept;

// ─── LyapunovRun ──────────────────────────────────────────────────────────────

/// Trajectory + tangent state captured together.
struct RunSnapshot {
    model::ThomasIntegrator integrator;
    LyapunovState           lyapunov;
};

/// Caller-supplied cancellation predicate; polled between batches of steps.
using CancelCheck = std::function<bool()>;

/// One Benettin run: a ThomasIntegrator and its LyapunovState.
///
/// # Example
/// ```cpp
/// tchaos::AnalysisConfig cfg;            // b = 0.19, dt = 0.005
/// tchaos::lyapunov::LyapunovRun run(cfg);
/// run.run_transient(cfg.transient_steps);
/// run.run(cfg.analysis_steps);
/// auto lambda = run.exponents();         // {λ1, λ2, λ3}
/// ```
class LyapunovRun {
public:
    /// # Throws
    /// `ValidationError` if `config.validate()` fails.
    explicit LyapunovRun(AnalysisConfig config);

    /// Integrate the trajectory only; the tangent state is untouched.
    void run_transient(std::uint64_t steps) noexcept;

    /// One analysis step (trajectory + tangent space).
    std::optional<RenormalizationSnapshot> step() noexcept;

    /// `steps` analysis steps. If `cancel` is set and `cancel_interval` > 0
    /// the predicate is polled every `cancel_interval` steps.
    ///
    /// # Returns
    /// Steps actually taken (< steps only when cancelled).
    std::uint64_t run(std::uint64_t      steps,
                      const CancelCheck& cancel          = {},
                      std::uint64_t      cancel_interval = 0);

    [[nodiscard]] Spectrum      exponents()    const noexcept;
    [[nodiscard]] bool          is_converged() const noexcept;
    [[nodiscard]] std::uint64_t step_count()   const noexcept;

    [[nodiscard]] const LyapunovState&           state()      const noexcept { return lyapunov_; }
    [[nodiscard]] const model::ThomasIntegrator& integrator() const noexcept { return integrator_; }
    [[nodiscard]] const AnalysisConfig&          config()     const noexcept { return config_; }

    /// Deep copy of the full run state.
    [[nodiscard]] RunSnapshot snapshot() const;

    /// Replace the run state with a previously taken snapshot.
    ///
    /// # Throws
    /// `ValidationError` if the snapshot belongs to a different b or dt.
    void restore(RunSnapshot snapshot);

    /// Back to the seed with a fresh tangent state.
    void reset();

private:
    AnalysisConfig          config_;
    model::ThomasIntegrator integrator_;
    LyapunovState           lyapunov_;
};

} // namespace tchaos::lyapunov
