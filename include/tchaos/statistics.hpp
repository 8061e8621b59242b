#pragma once

/// @file include/tchaos/statistics.hpp
/// @brief Statistical validation: bootstrap confidence intervals and the
///        0-1 test for chaos.
///
/// # Module: Statistical Validator
///
/// ## Responsibility
/// Attach uncertainty to the point estimates of a run and provide a
/// model-free cross-check of chaoticity:
///   - `bootstrap_ctm`: percentile CI on CTM, λ1 and D_KY from resampled
///     FTLE windows
///   - `exponent_confidence`: per-axis CI on the exponents themselves
///   - `zero_one_test`: Gottwald-Melbourne K statistic on a scalar observable
///
/// ## Percentile interval
/// For N sorted resample values and α = 1 − level:
///
///     lower = v[⌊N·α/2⌋],   upper = v[⌈N·(1 − α/2)⌉ − 1]
///
/// ## 0-1 test
/// For a series φ_0..φ_{n−1} and frequency c:
///
///     p_i = Σ_{k≤i} φ_k cos((k+1)c),   q_i = Σ_{k≤i} φ_k sin((k+1)c)
///     M(j) = 1/(n − j_max) Σ_{i<n−j_max} (p_{i+j} − p_i)² + (q_{i+j} − q_i)²
///     D(j) = M(j) − E[φ]² (1 − cos jc) / (1 − cos c)
///     K    = corr(j, D(j)),  j = 1..j_max,  j_max = ⌊n/10⌋
///
/// K ≈ 1 for chaotic dynamics, K ≈ 0 for regular dynamics.
///
/// ## Guarantees
/// - Deterministic for a fixed `rng_seed` (std::mt19937_64).
/// - lower ≤ upper for every reported interval.
/// - K is always finite and in [−1, 1].
///
/// ## NOT Responsible For
/// - Producing the FTLE windows (see src/lyapunov/)

#include "tchaos/constants.hpp"
#include "tchaos/ctm.hpp"
#include "tchaos/lyapunov.hpp"
#include "tchaos/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tchaos::stats {

// ─── Intervals & summaries ────────────────────────────────────────────────────

/// Two-sided percentile interval.
struct ConfidenceInterval {
    double      lower;
    double      upper;
    double      level;    ///< e.g. 0.95
    std::size_t samples;  ///< Values the interval was drawn from

    [[nodiscard]] bool   contains(double x) const noexcept { return x >= lower && x <= upper; }
    [[nodiscard]] double width()            const noexcept { return upper - lower; }
};

/// Descriptive statistics of one resampled quantity.
struct SampleSummary {
    double             mean;
    double             stddev;  ///< Sample standard deviation (n − 1)
    double             median;  ///< v[⌊n/2⌋] of the sorted values
    double             min;
    double             max;
    ConfidenceInterval ci;
};

/// Percentile interval of an ascending-sorted span.
///
/// # Returns
/// `nullopt` for an empty span or a level outside (0, 1).
[[nodiscard]] std::optional<ConfidenceInterval>
percentile_interval(std::span<const double> sorted, double level) noexcept;

/// Sort a copy of `values` and summarize it.
///
/// # Returns
/// `nullopt` if `values` is empty, contains NaN/Inf, or `level` ∉ (0, 1).
[[nodiscard]] std::optional<SampleSummary>
summarize(std::span<const double> values, double level);

// ─── Bootstrap ────────────────────────────────────────────────────────────────

struct BootstrapConfig {
    std::size_t   num_bootstrap    = constants::DEFAULT_NUM_BOOTSTRAP;
    double        confidence_level = constants::DEFAULT_CONFIDENCE_LEVEL;
    std::uint64_t rng_seed         = constants::DEFAULT_RNG_SEED;
    double        sum_tolerance    = constants::SUM_IDENTITY_TOLERANCE;

    /// Throws `ValidationError` for zero resamples, a level outside (0, 1)
    /// or a non-positive tolerance.
    void validate() const;
};

/// Result of `bootstrap_ctm`.
struct BootstrapResult {
    /// CTM evaluated at the mean window spectrum (no resampling).
    ctm::ChaosMetricResult point_estimate;

    /// Resample whose CTM is the median of all resampled CTMs.
    ctm::ChaosMetricResult representative;

    SampleSummary ctm_stats;
    SampleSummary lambda1_stats;
    SampleSummary kaplan_yorke_stats;

    std::size_t windows;    ///< FTLE windows resampled
    std::size_t resamples;  ///< Successful resamples (= num_bootstrap)

    [[nodiscard]] bool        is_finite() const noexcept;
    [[nodiscard]] std::string to_string() const;
};

/// Bootstrap CTM, λ1 and D_KY over finite-time windows.
///
/// Each resample draws `windows.size()` windows with replacement, averages
/// their exponents per axis and recomputes the full chaos metric at `b`.
///
/// # Throws
/// - `InsufficientDataError` with fewer than MIN_BOOTSTRAP_WINDOWS windows
/// - `ValidationError` for an invalid config, b ≤ 0, or a non-finite window
[[nodiscard]] BootstrapResult
bootstrap_ctm(std::span<const lyapunov::FtleWindow> windows,
              double                                b,
              const BootstrapConfig&                config = {});

// ─── Exponent confidence ──────────────────────────────────────────────────────

/// CI of one Lyapunov exponent across FTLE windows.
struct AxisConfidence {
    double             estimate;  ///< Whole-run exponent
    double             stddev;    ///< Sample std of the window exponents
    ConfidenceInterval ci;
};

using ExponentConfidence = std::array<AxisConfidence, PHASE_DIM>;

/// Per-axis percentile interval of the window exponents around the
/// whole-run `estimate`.
///
/// With fewer than MIN_BOOTSTRAP_WINDOWS windows every axis degenerates to
/// [λ_i, λ_i] with std 0.
///
/// # Throws
/// `ValidationError` if `level` ∉ (0, 1).
[[nodiscard]] ExponentConfidence
exponent_confidence(std::span<const lyapunov::FtleWindow> windows,
                    const Spectrum&                       estimate,
                    double level = constants::DEFAULT_CONFIDENCE_LEVEL);

// ─── 0-1 test ─────────────────────────────────────────────────────────────────

enum class ZeroOneVerdict {
    Regular,
    Indeterminate,
    Chaotic,
};

/// "regular", "indeterminate" or "chaotic".
[[nodiscard]] std::string_view to_string(ZeroOneVerdict verdict) noexcept;

/// K > 0.9 chaotic, K < 0.1 regular, indeterminate otherwise.
[[nodiscard]] ZeroOneVerdict classify_zero_one(double k) noexcept;

struct ZeroOneConfig {
    double c            = constants::ZERO_ONE_C;             ///< Translation frequency
    double cut_fraction = constants::ZERO_ONE_CUT_FRACTION;  ///< j_max = ⌊n·cut⌋
};

struct ZeroOneResult {
    double         k;
    ZeroOneVerdict verdict;
    std::size_t    samples;
    std::size_t    max_lag;
    bool           reliable;  ///< samples ≥ ZERO_ONE_RELIABLE_SAMPLES

    [[nodiscard]] bool        is_finite() const noexcept;
    [[nodiscard]] std::string to_string() const;
};

/// Gottwald-Melbourne 0-1 test (correlation method).
///
/// # Throws
/// - `InsufficientDataError` for fewer than ZERO_ONE_MIN_SAMPLES values
/// - `ValidationError` for a non-finite series, cos(c) = 1, or a cut
///   fraction outside (0, 0.5]
[[nodiscard]] ZeroOneResult zero_one_test(std::span<const double> series,
                                          const ZeroOneConfig&    config = {});

} // namespace tchaos::stats
