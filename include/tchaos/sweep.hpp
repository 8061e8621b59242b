#pragma once

/// @file include/tchaos/sweep.hpp
/// @brief Parameter sweep over b with refinement zones and post-sweep analysis.
///
/// # Module: Sweep Orchestrator
///
/// ## Responsibility
/// Run the full analysis pipeline at every point of a b-grid:
///
///     fresh integrator → transient (discarded) → Benettin analysis
///       → CTM → exponent CI → bootstrap CI (≥ 10 FTLE windows)
///
/// track job status and progress, isolate per-point failures, and summarize
/// the resulting CTM(b) curve (extrema, inflections, regime transitions,
/// chaos onset, convergence statistics).
///
/// ## Guarantees
/// - A failing point is recorded with its error and the sweep continues.
/// - Status moves Pending → Running → {Completed, Error, Cancelled}. Only a
///   Pending job may be run; only a Pending or Cancelled job may be resumed.
///   Completed and Error are terminal.
/// - A job never stays Running after `run`/`resume` return or throw.
/// - `run_point` is a pure function of (config, b): independent points may
///   be evaluated concurrently by the caller. The library spawns no threads.
///
/// ## NOT Responsible For
/// - Persisting or exporting sweep results
/// - Scheduling points on worker threads

#include "tchaos/config.hpp"
#include "tchaos/constants.hpp"
#include "tchaos/ctm.hpp"
#include "tchaos/lyapunov.hpp"
#include "tchaos/statistics.hpp"
#include "tchaos/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tchaos::sweep {

// ─── Grid ─────────────────────────────────────────────────────────────────────

/// Sub-range sampled with a finer step.
struct RefinementZone {
    double lo;
    double hi;
    double step;
};

/// Base lattice b_min + i·b_step over [b_min, b_max] plus every zone's own
/// lattice lo + k·step over [lo, hi].
struct GridSpec {
    double b_min  = constants::SWEEP_B_MIN;
    double b_max  = constants::SWEEP_B_MAX;
    double b_step = constants::SWEEP_B_STEP;

    std::vector<RefinementZone> zones{
        {constants::SWEEP_ZONE_LO, constants::SWEEP_ZONE_HI, constants::SWEEP_ZONE_STEP}};

    /// Throws `ValidationError` unless 0 < b_min ≤ b_max, b_step > 0 and
    /// every zone has lo ≤ hi and step > 0 (all values finite).
    void validate() const;
};

/// Merge the base and zone lattices, round to GRID_ROUNDING_DECIMALS,
/// sort, de-duplicate and keep values inside [b_min, b_max].
///
/// # Throws
/// `ValidationError` if `spec.validate()` fails.
[[nodiscard]] std::vector<double> generate_grid(const GridSpec& spec);

// ─── Per-point results ────────────────────────────────────────────────────────

enum class SweepStatus {
    Pending,
    Running,
    Completed,
    Error,
    Cancelled,
};

[[nodiscard]] std::string_view to_string(SweepStatus status) noexcept;

/// Exponent estimate captured during the analysis phase.
struct Checkpoint {
    std::uint64_t step;
    Spectrum      exponents;
    bool          converged;
};

/// Outcome of one grid point.
struct PointResult {
    double      b         = 0.0;
    bool        ok        = false;
    bool        cancelled = false;  ///< Stopped by a mid-point cancel check
    std::string error;              ///< Set when !ok

    Spectrum      exponents{};
    bool          converged  = false;
    std::uint64_t iterations = 0;   ///< Analysis steps taken

    std::optional<ctm::ChaosMetricResult>  metrics;
    std::optional<stats::ExponentConfidence> exponent_ci;
    std::optional<stats::BootstrapResult>  bootstrap;  ///< ≥ 10 FTLE windows only

    std::vector<Checkpoint> checkpoints;
    std::size_t             ftle_windows = 0;
    double                  elapsed_ms   = 0.0;

    [[nodiscard]] std::string to_string() const;
};

// ─── Post-sweep analysis ──────────────────────────────────────────────────────

/// One successful point of the CTM(b) curve.
struct CurvePoint {
    double              b;
    double              ctm;
    double              lambda1;
    tchaos::ctm::Regime regime;
    bool                converged;
    std::uint64_t       iterations;
};

/// Successful points in grid order.
[[nodiscard]] std::vector<CurvePoint> curve(std::span<const PointResult> points);

struct CriticalPoint {
    enum class Kind { Maximum, Minimum, Inflection };

    Kind        kind;
    double      b;
    double      ctm;
    std::size_t index;  ///< Position in the curve
};

[[nodiscard]] std::string_view to_string(CriticalPoint::Kind kind) noexcept;

struct RegimeTransition {
    tchaos::ctm::Regime from;
    tchaos::ctm::Regime to;
    double              b;      ///< First b of the new regime
    double              ctm;
    std::size_t         index;
};

struct ChaosOnset {
    double b;
    double lambda1;
    double ctm;
};

struct SweepStatistics {
    double      min_ctm;
    double      max_ctm;
    double      mean_ctm;
    double      max_chaos_b;         ///< b of the (first) maximum CTM
    double      converged_ratio;     ///< Converged / successful points
    double      average_iterations;  ///< Mean iterations of converged points
    std::size_t evaluated_points;
    std::size_t failed_points;
};

struct SweepAnalysis {
    std::vector<CriticalPoint>    critical_points;
    std::vector<RegimeTransition> transitions;
    std::optional<ChaosOnset>     chaos_onset;
    SweepStatistics               statistics;

    [[nodiscard]] std::string to_string() const;
};

/// Three-point local maxima and minima, and inflection points where the
/// second difference changes sign (checked for 1 < i < n − 2).
[[nodiscard]] std::vector<CriticalPoint>
find_critical_points(std::span<const CurvePoint> points);

/// Every change of regime between consecutive curve points.
[[nodiscard]] std::vector<RegimeTransition>
find_transitions(std::span<const CurvePoint> points);

/// First curve point with λ1 > 0.
[[nodiscard]] std::optional<ChaosOnset>
find_chaos_onset(std::span<const CurvePoint> points) noexcept;

/// Full analysis; `nullopt` when no point succeeded.
[[nodiscard]] std::optional<SweepAnalysis>
analyze(std::span<const PointResult> points);

// ─── Configuration ────────────────────────────────────────────────────────────

/// AnalysisConfig with the sweep's longer analysis phase.
[[nodiscard]] AnalysisConfig default_point_config() noexcept;

struct SweepConfig {
    GridSpec grid{};

    /// Per-point settings; `b` is overwritten by each grid value.
    AnalysisConfig analysis = default_point_config();

    /// Poll the job's cancel flag every this many steps inside a point
    /// (0 checks only between points).
    std::uint64_t cancel_check_interval = 0;

    /// Exponent checkpoints per point.
    std::size_t checkpoints = constants::SWEEP_CHECKPOINTS;

    /// Compute bootstrap CIs when enough FTLE windows exist.
    bool compute_bootstrap = true;

    /// If true, print one progress line per point to stderr.
    bool verbose = false;

    /// Throws `ValidationError` for an invalid grid or analysis config.
    void validate() const;
};

// ─── Job ──────────────────────────────────────────────────────────────────────

/// Mutable status of one sweep. Owned by the caller; `cancel()` may be
/// called from another thread while the orchestrator runs.
class SweepJob {
public:
    SweepJob() = default;

    SweepJob(const SweepJob&)            = delete;
    SweepJob& operator=(const SweepJob&) = delete;

    [[nodiscard]] SweepStatus                     status()   const noexcept { return status_; }
    [[nodiscard]] double                          progress() const noexcept { return progress_; }
    [[nodiscard]] const std::vector<double>&      grid()     const noexcept { return grid_; }
    [[nodiscard]] const std::vector<PointResult>& points()   const noexcept { return points_; }

    /// Request cancellation; honoured between points and, when enabled,
    /// every `cancel_check_interval` steps inside a point.
    void cancel() noexcept { cancel_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool cancel_requested() const noexcept {
        return cancel_.load(std::memory_order_relaxed);
    }

private:
    friend class SweepOrchestrator;

    SweepStatus              status_   = SweepStatus::Pending;
    double                   progress_ = 0.0;
    std::vector<double>      grid_;
    std::vector<PointResult> points_;
    std::atomic<bool>        cancel_{false};
};

/// Passed to the progress callback after every point.
struct SweepProgress {
    double             progress;   ///< completed / total
    double             current_b;
    std::size_t        completed;
    std::size_t        total;
    const PointResult& result;
};

using ProgressCallback = std::function<void(const SweepProgress&)>;

/// Evaluates one grid point. Defaults to `SweepOrchestrator::run_point`.
using PointRunner =
    std::function<PointResult(const SweepConfig&, double, const lyapunov::CancelCheck&)>;

/// Snapshot of a finished (or stopped) sweep.
struct SweepResult {
    SweepStatus                  status;
    std::vector<double>          grid;
    std::vector<PointResult>     points;
    std::optional<SweepAnalysis> analysis;
    double                       elapsed_ms;

    [[nodiscard]] std::string to_string() const;
};

// ─── SweepOrchestrator ────────────────────────────────────────────────────────

/// Drives a `SweepJob` across the grid.
///
/// # Example
/// ```cpp
/// tchaos::sweep::SweepConfig cfg;
/// cfg.grid = {.b_min = 0.15, .b_max = 0.25, .b_step = 0.01, .zones = {}};
/// tchaos::sweep::SweepOrchestrator orch(cfg);
/// tchaos::sweep::SweepJob job;
/// auto result = orch.run(job);
/// if (result.analysis) fmt::print("{}\n", result.analysis->to_string());
/// ```
class SweepOrchestrator {
public:
    /// # Throws
    /// `ValidationError` if `config.validate()` fails.
    explicit SweepOrchestrator(SweepConfig config, PointRunner runner = {});

    /// Generate the grid and evaluate every point from the start.
    ///
    /// # Throws
    /// `ValidationError` unless the job is Pending. An exception thrown by
    /// `on_progress` propagates after the job is marked Cancelled.
    SweepResult run(SweepJob& job, const ProgressCallback& on_progress = {}) const;

    /// Keep the job's results with b ≤ `from_b` and evaluate the remaining
    /// grid points (those with b > `from_b`). A job that was never run gets
    /// its grid generated first.
    ///
    /// # Throws
    /// `ValidationError` unless the job is Pending or Cancelled.
    SweepResult resume(SweepJob&               job,
                       double                  from_b,
                       const ProgressCallback& on_progress = {}) const;

    /// Full pipeline at one b. Never touches shared state.
    ///
    /// # Throws
    /// `ValidationError` for an invalid b or configuration.
    [[nodiscard]] static PointResult run_point(const SweepConfig&           config,
                                               double                       b,
                                               const lyapunov::CancelCheck& cancel = {});

    [[nodiscard]] const SweepConfig& config() const noexcept { return config_; }

private:
    SweepResult execute(SweepJob& job, std::size_t first, const ProgressCallback& on_progress) const;

    SweepConfig config_;
    PointRunner runner_;
};

} // namespace tchaos::sweep
