#pragma once

#include <cstddef>
#include <cstdint>
#include <numbers>

/// @file include/tchaos/constants.hpp
/// @brief Numerical defaults and tolerances for the Thomas chaos library.

namespace tchaos::constants {

// ─── Thomas System Defaults ───────────────────────────────────────────────────

/// Default dissipation parameter b (chaotic regime).
static constexpr double DEFAULT_B = 0.19;

/// Default fixed RK4 step.
static constexpr double DEFAULT_DT = 0.005;

/// Default initial condition (x, y, z).
static constexpr double DEFAULT_SEED_X = 0.1;
static constexpr double DEFAULT_SEED_Y = 0.0;
static constexpr double DEFAULT_SEED_Z = 0.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// |trace(J) − (−3b)| must stay below this for the model self-test.
static constexpr double DIVERGENCE_TOLERANCE = 1e-10;

/// Floor for QR diagonal entries before taking ln|R_ii|.
/// A near-degenerate tangent direction contributes ln(1e-10) instead of −∞.
static constexpr double QR_DIAGONAL_FLOOR = 1e-10;

/// Default tolerance for the sum identity Σλ = −3b.
static constexpr double SUM_IDENTITY_TOLERANCE = 1e-2;

/// Tight sum-identity tolerance used on long, converged runs.
static constexpr double SUM_IDENTITY_TOLERANCE_STRICT = 1e-3;

// ─── Benettin / QR ────────────────────────────────────────────────────────────

/// Default number of integration steps between QR renormalizations.
static constexpr std::uint32_t DEFAULT_QR_PERIOD = 5;

// ─── Convergence Monitor ──────────────────────────────────────────────────────

/// Steps between convergence snapshots.
static constexpr std::uint64_t CONVERGENCE_CHECK_INTERVAL = 1000;

/// Convergence is never declared before this many steps.
static constexpr std::uint64_t MIN_CONVERGENCE_STEPS = 10'000;

/// Maximum per-axis change of the windowed exponent means.
static constexpr double CONVERGENCE_TOLERANCE = 1e-6;

/// Snapshots retained by the monitor (two halves of CONVERGENCE_HALF_WINDOW).
static constexpr std::size_t CONVERGENCE_HISTORY = 10;
static constexpr std::size_t CONVERGENCE_HALF_WINDOW = 5;

// ─── FTLE Windows ─────────────────────────────────────────────────────────────

/// Default finite-time window length in steps.
static constexpr std::uint64_t DEFAULT_FTLE_WINDOW = 10'000;

/// Completed windows kept in the ring buffer.
static constexpr std::size_t FTLE_BUFFER_CAPACITY = 100;

// ─── CTM Regime Bands ─────────────────────────────────────────────────────────

/// Upper CTM bounds of the chaotic regimes (canonical banding).
static constexpr double CTM_WEAK_CHAOS_MAX     = 0.05;
static constexpr double CTM_MODERATE_CHAOS_MAX = 0.15;
static constexpr double CTM_STRONG_CHAOS_MAX   = 0.25;

/// Lower bound of the geometric-complexity component: D_KY − 2.
static constexpr double CTM_DIMENSION_OFFSET = 2.0;

// ─── Statistical Validation ───────────────────────────────────────────────────

/// Minimum FTLE windows required for a bootstrap interval.
static constexpr std::size_t MIN_BOOTSTRAP_WINDOWS = 10;

/// Default number of bootstrap resamples.
static constexpr std::size_t DEFAULT_NUM_BOOTSTRAP = 200;

/// Default two-sided confidence level.
static constexpr double DEFAULT_CONFIDENCE_LEVEL = 0.95;

/// Default seed of the bootstrap generator (std::mt19937_64).
static constexpr std::uint64_t DEFAULT_RNG_SEED = 0x7410'3b19ULL;

/// Translation frequency of the 0-1 test.
static constexpr double ZERO_ONE_C = std::numbers::pi;

/// Fraction of the series used as maximum lag (n/10).
static constexpr double ZERO_ONE_CUT_FRACTION = 0.1;

/// Hard minimum series length for the 0-1 test.
static constexpr std::size_t ZERO_ONE_MIN_SAMPLES = 100;

/// Below this length the 0-1 result is flagged unreliable.
static constexpr std::size_t ZERO_ONE_RELIABLE_SAMPLES = 1000;

/// K thresholds of the 0-1 verdict.
static constexpr double ZERO_ONE_CHAOTIC_K = 0.9;
static constexpr double ZERO_ONE_REGULAR_K = 0.1;

// ─── Run Lengths ──────────────────────────────────────────────────────────────

/// Default discarded transient (trajectory only).
static constexpr std::uint64_t DEFAULT_TRANSIENT_STEPS = 2000;

/// Default analysis phase length for a single-point run.
static constexpr std::uint64_t DEFAULT_ANALYSIS_STEPS = 20'000;

// ─── Parameter Sweep ──────────────────────────────────────────────────────────

static constexpr double SWEEP_B_MIN  = 0.10;
static constexpr double SWEEP_B_MAX  = 0.40;
static constexpr double SWEEP_B_STEP = 0.01;

/// Default refinement zone around the chaos onset.
static constexpr double SWEEP_ZONE_LO   = 0.17;
static constexpr double SWEEP_ZONE_HI   = 0.21;
static constexpr double SWEEP_ZONE_STEP = 0.001;

/// Analysis steps per grid point (20 FTLE windows at the default size).
static constexpr std::uint64_t SWEEP_ANALYSIS_STEPS = 200'000;

/// Grid values are rounded to this many decimals before de-duplication.
static constexpr int GRID_ROUNDING_DECIMALS = 9;

/// Exponent checkpoints recorded per grid point.
static constexpr std::size_t SWEEP_CHECKPOINTS = 10;

} // namespace tchaos::constants
