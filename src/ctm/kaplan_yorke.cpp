/// @file src/ctm/kaplan_yorke.cpp
/// @brief Kaplan-Yorke dimension and the two CTM components.
///
///   D_KY = j + (λ_1 + … + λ_j) / |λ_{j+1}|
///   C_λ  = 1 − exp(−λ1 / (3b))
///   C_D  = clamp(D_KY − 2, 0, 1)
///
/// 3b is the phase-space contraction rate, so C_λ measures instability
/// relative to dissipation and is independent of the time unit.

#include "tchaos/ctm.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

namespace tchaos::ctm {

double kaplan_yorke_dimension(std::span<const double> exponents) {
    if (exponents.empty()) return 0.0;
    if (!std::all_of(exponents.begin(), exponents.end(),
                     [](double l) { return std::isfinite(l); })) {
        return 0.0;
    }

    std::vector<double> sorted(exponents.begin(), exponents.end());
    std::sort(sorted.begin(), sorted.end(), std::greater<>());

    if (!(sorted.front() > 0.0)) return 0.0;

    double      partial = 0.0;
    std::size_t j       = 0;
    for (; j < sorted.size(); ++j) {
        if (partial + sorted[j] < 0.0) break;
        partial += sorted[j];
    }

    if (j == sorted.size()) {
        return static_cast<double>(sorted.size());
    }

    const double d = static_cast<double>(j) + partial / std::abs(sorted[j]);
    return std::max(0.0, d);
}

double c_lambda(double lambda1, double b) noexcept {
    if (!(lambda1 > 0.0) || !(b > 0.0)) return 0.0;
    return 1.0 - std::exp(-lambda1 / (3.0 * b));
}

double c_dimension(double kaplan_yorke) noexcept {
    return std::clamp(kaplan_yorke - constants::CTM_DIMENSION_OFFSET, 0.0, 1.0);
}

double composite(double instability, double complexity) noexcept {
    const double product = instability * complexity;
    if (!(product > 0.0)) return 0.0;
    return std::min(1.0, std::sqrt(product));
}

} // namespace tchaos::ctm
