/// @file src/sweep/parameter_grid.cpp
/// @brief b-grid generation with refinement zones.
///
/// Lattices are generated by index (lo + k·step), never by repeated
/// addition, so no rounding error accumulates along a lattice. Merged values
/// are rounded to GRID_ROUNDING_DECIMALS before de-duplication so that a
/// zone point and a base point at the same b collapse to one entry.

#include "tchaos/sweep.hpp"
#include "tchaos/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace tchaos::sweep {

namespace {

/// Upper bound on points in any single lattice.
constexpr double MAX_LATTICE_POINTS = 1e6;

/// Slack for lattice end points that land on hi up to rounding.
constexpr double LATTICE_EPS = 1e-9;

double round_grid(double v) noexcept {
    const double scale = std::pow(10.0, constants::GRID_ROUNDING_DECIMALS);
    return std::round(v * scale) / scale;
}

void append_lattice(std::vector<double>& out, double lo, double hi, double step) {
    const double count = std::floor((hi - lo) / step + LATTICE_EPS);
    for (double k = 0.0; k <= count; k += 1.0) {
        out.push_back(round_grid(lo + k * step));
    }
}

void require_finite(double v, const char* field) {
    if (!std::isfinite(v)) {
        throw ValidationError(fmt::format("GridSpec.{}: must be finite (got {})", field, v));
    }
}

}  // namespace

// ─── GridSpec::validate ───────────────────────────────────────────────────────

void GridSpec::validate() const {
    require_finite(b_min, "b_min");
    require_finite(b_max, "b_max");
    require_finite(b_step, "b_step");

    if (b_min <= 0.0) {
        throw ValidationError(fmt::format("GridSpec.b_min: must be > 0 (got {})", b_min));
    }
    if (b_max < b_min) {
        throw ValidationError(fmt::format(
            "GridSpec: b_max ({}) must be >= b_min ({})", b_max, b_min));
    }
    if (b_step <= 0.0) {
        throw ValidationError(fmt::format("GridSpec.b_step: must be > 0 (got {})", b_step));
    }
    if ((b_max - b_min) / b_step > MAX_LATTICE_POINTS) {
        throw ValidationError("GridSpec: base lattice has too many points");
    }

    for (std::size_t i = 0; i < zones.size(); ++i) {
        const auto& z = zones[i];
        if (!std::isfinite(z.lo) || !std::isfinite(z.hi) || !std::isfinite(z.step)) {
            throw ValidationError(fmt::format("GridSpec.zones[{}]: non-finite bound", i));
        }
        if (z.hi < z.lo || z.step <= 0.0) {
            throw ValidationError(fmt::format(
                "GridSpec.zones[{}]: need lo <= hi and step > 0 (got [{}, {}] step {})",
                i, z.lo, z.hi, z.step));
        }
        if ((z.hi - z.lo) / z.step > MAX_LATTICE_POINTS) {
            throw ValidationError(fmt::format("GridSpec.zones[{}]: too many points", i));
        }
    }
}

// ─── generate_grid ────────────────────────────────────────────────────────────

std::vector<double> generate_grid(const GridSpec& spec) {
    spec.validate();

    std::vector<double> grid;
    append_lattice(grid, spec.b_min, spec.b_max, spec.b_step);
    for (const auto& z : spec.zones) {
        append_lattice(grid, z.lo, z.hi, z.step);
    }

    const double lo = round_grid(spec.b_min);
    const double hi = round_grid(spec.b_max);
    std::erase_if(grid, [lo, hi](double b) { return b < lo || b > hi; });

    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end()), grid.end());
    return grid;
}

} // namespace tchaos::sweep
