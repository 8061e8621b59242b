#pragma once

/// @file include/tchaos/ctm.hpp
/// @brief Kaplan-Yorke dimension and the composite chaos meter (CTM).
///
/// # Module: Composite Metric Calculator
///
/// ## Responsibility
/// Turn a Lyapunov spectrum into scalar diagnostics:
///   - Kaplan-Yorke dimension D_KY
///   - dynamic instability     C_λ = 1 − exp(−λ1 / (3b))
///   - geometric complexity    C_D = clamp(D_KY − 2, 0, 1)
///   - composite meter         CTM = √(C_λ · C_D)
///   - regime label and the sum-identity check Σλ = −3b
///
/// ## Guarantees
/// - Pure: the result depends only on the spectrum and b.
/// - CTM ∈ [0, 1] for every finite spectrum.
/// - D_KY ∈ [0, 3], and D_KY = 0 whenever λ1 ≤ 0.
/// - The sum identity is reported, never thrown.
/// - NaN/Inf spectra produce `std::nullopt`.
///
/// ## NOT Responsible For
/// - Estimating the spectrum (see src/lyapunov/)
/// - Confidence intervals (see src/statistics/)

#include "tchaos/constants.hpp"
#include "tchaos/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tchaos::ctm {

// ─── Regime ───────────────────────────────────────────────────────────────────

/// Qualitative dynamical regime derived from CTM and λ1.
enum class Regime {
    Regular,
    WeakChaos,
    ModerateChaos,
    StrongChaos,
    Hyperchaotic,
};

/// Stable lowercase label: "regular", "weak-chaos", "moderate-chaos",
/// "strong-chaos", "hyperchaotic".
[[nodiscard]] std::string_view to_string(Regime regime) noexcept;

/// Regular if λ1 ≤ 0 or CTM ≤ 0; otherwise banded on CTM at
/// 0.05 / 0.15 / 0.25.
[[nodiscard]] Regime classify_regime(double ctm, double lambda1) noexcept;

// ─── Component functions ──────────────────────────────────────────────────────

/// Kaplan-Yorke (Lyapunov) dimension.
///
/// # Algorithm
/// Sort descending. Find the largest j with λ_1 + … + λ_j ≥ 0.
///   - λ_1 ≤ 0            → 0
///   - j = n              → n
///   - otherwise          → j + (λ_1 + … + λ_j) / |λ_{j+1}|
/// floored at 0.
///
/// # Returns
/// 0 for an empty span or one holding a NaN or infinite exponent.
[[nodiscard]] double kaplan_yorke_dimension(std::span<const double> exponents);

/// C_λ = 1 − exp(−λ1 / (3b)); 0 when λ1 ≤ 0 or b ≤ 0.
[[nodiscard]] double c_lambda(double lambda1, double b) noexcept;

/// C_D = clamp(D_KY − 2, 0, 1).
[[nodiscard]] double c_dimension(double kaplan_yorke) noexcept;

/// Geometric mean √(C_λ · C_D), clamped to [0, 1].
[[nodiscard]] double composite(double instability, double complexity) noexcept;

// ─── Sum identity ─────────────────────────────────────────────────────────────

/// Σλ versus the analytic −3b.
struct SumIdentityCheck {
    double sum;             ///< λ1 + λ2 + λ3
    double expected;        ///< −3b
    double error;           ///< |sum − expected|
    double relative_error;  ///< error / |expected|
    bool   is_valid;        ///< error < tolerance
};

[[nodiscard]] SumIdentityCheck
check_sum_identity(const Spectrum& exponents,
                   double          b,
                   double          tolerance = constants::SUM_IDENTITY_TOLERANCE) noexcept;

// ─── ChaosMetricResult ────────────────────────────────────────────────────────

struct CtmComponents {
    double c_lambda;     ///< Dynamic instability in [0, 1)
    double c_dimension;  ///< Geometric complexity in [0, 1]
};

/// Everything derived from one spectrum.
struct ChaosMetricResult {
    double           b;
    Spectrum         exponents;     ///< Sorted descending
    double           lambda1;       ///< exponents[0]
    double           kaplan_yorke;
    CtmComponents    components;
    double           ctm;
    Regime           regime;
    SumIdentityCheck sum_identity;

    /// False if any stored quantity is NaN or ±Inf.
    [[nodiscard]] bool is_finite() const noexcept;

    /// CTM and both components in [0, 1], D_KY in [0, 3].
    [[nodiscard]] bool is_bounded() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── CtmCalculator ────────────────────────────────────────────────────────────

/// Computes `ChaosMetricResult` for a fixed b.
///
/// # Example
/// ```cpp
/// tchaos::ctm::CtmCalculator calc(0.19);
/// auto r = calc.compute({0.03, 0.0, -0.60});
/// if (r) fmt::print("{}\n", r->to_string());
/// ```
class CtmCalculator {
public:
    /// # Throws
    /// `ValidationError` if b ≤ 0, or the tolerance is not finite and > 0.
    explicit CtmCalculator(double b,
                           double sum_tolerance = constants::SUM_IDENTITY_TOLERANCE);

    /// # Returns
    /// `nullopt` if any exponent is NaN or ±Inf.
    [[nodiscard]] std::optional<ChaosMetricResult>
    compute(const Spectrum& exponents) const;

    [[nodiscard]] double b()             const noexcept { return b_; }
    [[nodiscard]] double sum_tolerance() const noexcept { return sum_tolerance_; }

private:
    double b_;
    double sum_tolerance_;
};

} // namespace tchaos::ctm
