#pragma once

/// @file include/tchaos/config.hpp
/// @brief AnalysisConfig: the single configuration type of a Lyapunov run.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Enumerate every tunable of one analysis run in one aggregate with
/// defaults taken from `constants.hpp`. `validate()` is the only gate: the
/// numerical components assume a validated configuration.
///
/// ## Example
/// ```cpp
/// tchaos::AnalysisConfig cfg;
/// cfg.b              = 0.21;
/// cfg.analysis_steps = 200'000;
/// cfg.validate();                 // throws tchaos::ValidationError
/// ```

#include "tchaos/constants.hpp"
#include "tchaos/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace tchaos {

struct AnalysisConfig {
    // ── Dynamical system ─────────────────────────────────────────────────────
    double b  = constants::DEFAULT_B;   ///< Dissipation parameter, > 0
    double dt = constants::DEFAULT_DT;  ///< RK4 step, > 0

    /// Initial condition (x, y, z).
    Spectrum seed{constants::DEFAULT_SEED_X,
                  constants::DEFAULT_SEED_Y,
                  constants::DEFAULT_SEED_Z};

    // ── Benettin / QR ────────────────────────────────────────────────────────
    std::uint32_t qr_period = constants::DEFAULT_QR_PERIOD;  ///< ≥ 1

    // ── FTLE windows ─────────────────────────────────────────────────────────
    std::uint64_t window_size = constants::DEFAULT_FTLE_WINDOW;  ///< multiple of qr_period

    // ── Convergence ──────────────────────────────────────────────────────────
    std::uint64_t min_convergence_steps      = constants::MIN_CONVERGENCE_STEPS;
    std::uint64_t convergence_check_interval = constants::CONVERGENCE_CHECK_INTERVAL;
    double        tolerance                  = constants::CONVERGENCE_TOLERANCE;

    // ── Statistics ───────────────────────────────────────────────────────────
    std::size_t   num_bootstrap          = constants::DEFAULT_NUM_BOOTSTRAP;
    double        confidence_level       = constants::DEFAULT_CONFIDENCE_LEVEL;
    double        sum_identity_tolerance = constants::SUM_IDENTITY_TOLERANCE;
    std::uint64_t rng_seed               = constants::DEFAULT_RNG_SEED;

    // ── Run lengths ──────────────────────────────────────────────────────────
    std::uint64_t transient_steps = constants::DEFAULT_TRANSIENT_STEPS;
    std::uint64_t analysis_steps  = constants::DEFAULT_ANALYSIS_STEPS;

    /// Check every field. Throws `ValidationError` naming the first offender.
    void validate() const;

    /// One-line summary for diagnostics.
    [[nodiscard]] std::string to_string() const;
};

} // namespace tchaos
