/// @file src/ctm/ctm_calculator.cpp
/// @brief CtmCalculator, regime classification and the sum-identity check.

#include "tchaos/ctm.hpp"
#include "tchaos/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <functional>
#include <numeric>

namespace tchaos::ctm {

// ─── Regime ───────────────────────────────────────────────────────────────────

std::string_view to_string(Regime regime) noexcept {
    switch (regime) {
        case Regime::Regular:       return "regular";
        case Regime::WeakChaos:     return "weak-chaos";
        case Regime::ModerateChaos: return "moderate-chaos";
        case Regime::StrongChaos:   return "strong-chaos";
        case Regime::Hyperchaotic:  return "hyperchaotic";
    }
    return "unknown";
}

Regime classify_regime(double ctm, double lambda1) noexcept {
    if (!(lambda1 > 0.0) || !(ctm > 0.0))        return Regime::Regular;
    if (ctm < constants::CTM_WEAK_CHAOS_MAX)     return Regime::WeakChaos;
    if (ctm < constants::CTM_MODERATE_CHAOS_MAX) return Regime::ModerateChaos;
    if (ctm < constants::CTM_STRONG_CHAOS_MAX)   return Regime::StrongChaos;
    return Regime::Hyperchaotic;
}

// ─── Sum identity ─────────────────────────────────────────────────────────────

SumIdentityCheck check_sum_identity(const Spectrum& exponents,
                                    double          b,
                                    double          tolerance) noexcept {
    const double sum      = std::accumulate(exponents.begin(), exponents.end(), 0.0);
    const double expected = -3.0 * b;
    const double error    = std::abs(sum - expected);

    return SumIdentityCheck{
        .sum            = sum,
        .expected       = expected,
        .error          = error,
        .relative_error = expected != 0.0 ? error / std::abs(expected) : error,
        .is_valid       = error < tolerance,
    };
}

// ─── ChaosMetricResult ────────────────────────────────────────────────────────

bool ChaosMetricResult::is_finite() const noexcept {
    const bool spectrum_ok = std::all_of(exponents.begin(), exponents.end(),
                                         [](double x) { return std::isfinite(x); });
    return spectrum_ok
        && std::isfinite(b)
        && std::isfinite(lambda1)
        && std::isfinite(kaplan_yorke)
        && std::isfinite(components.c_lambda)
        && std::isfinite(components.c_dimension)
        && std::isfinite(ctm)
        && std::isfinite(sum_identity.sum)
        && std::isfinite(sum_identity.error);
}

bool ChaosMetricResult::is_bounded() const noexcept {
    auto unit = [](double x) { return x >= 0.0 && x <= 1.0; };
    return unit(ctm)
        && unit(components.c_lambda)
        && unit(components.c_dimension)
        && kaplan_yorke >= 0.0
        && kaplan_yorke <= static_cast<double>(PHASE_DIM);
}

std::string ChaosMetricResult::to_string() const {
    return fmt::format(
        "b={:.4f}  λ=({:+.5f}, {:+.5f}, {:+.5f})  D_KY={:.4f}  "
        "C_λ={:.4f}  C_D={:.4f}  CTM={:.4f}  regime={}  "
        "Σλ={:+.5f} (expected {:+.5f}, err {:.2e}{})",
        b, exponents[0], exponents[1], exponents[2], kaplan_yorke,
        components.c_lambda, components.c_dimension, ctm,
        tchaos::ctm::to_string(regime),
        sum_identity.sum, sum_identity.expected, sum_identity.error,
        sum_identity.is_valid ? "" : ", FAILED");
}

// ─── CtmCalculator ────────────────────────────────────────────────────────────

CtmCalculator::CtmCalculator(double b, double sum_tolerance)
    : b_(b)
    , sum_tolerance_(sum_tolerance) {
    if (!std::isfinite(b) || b <= 0.0) {
        throw ValidationError(
            fmt::format("CtmCalculator: b must be finite and > 0 (got {})", b));
    }
    if (!std::isfinite(sum_tolerance) || sum_tolerance <= 0.0) {
        throw ValidationError(fmt::format(
            "CtmCalculator: sum tolerance must be finite and > 0 (got {})", sum_tolerance));
    }
}

std::optional<ChaosMetricResult>
CtmCalculator::compute(const Spectrum& exponents) const {
    for (double x : exponents) {
        if (!std::isfinite(x)) return std::nullopt;
    }

    Spectrum sorted = exponents;
    std::sort(sorted.begin(), sorted.end(), std::greater<>());

    const double lambda1 = sorted[0];
    const double dky     = kaplan_yorke_dimension(sorted);
    const double cl      = c_lambda(lambda1, b_);
    const double cd      = c_dimension(dky);
    const double metric  = composite(cl, cd);

    return ChaosMetricResult{
        .b            = b_,
        .exponents    = sorted,
        .lambda1      = lambda1,
        .kaplan_yorke = dky,
        .components   = {.c_lambda = cl, .c_dimension = cd},
        .ctm          = metric,
        .regime       = classify_regime(metric, lambda1),
        .sum_identity = check_sum_identity(sorted, b_, sum_tolerance_),
    };
}

} // namespace tchaos::ctm
