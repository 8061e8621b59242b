/// @file src/config/analysis_config.cpp
/// @brief AnalysisConfig validation and diagnostic formatting.

#include "tchaos/config.hpp"
#include "tchaos/errors.hpp"

#include <cmath>
#include <fmt/format.h>

namespace tchaos {

namespace {

void require(bool condition, const char* field, const std::string& detail) {
    if (!condition) {
        throw ValidationError(fmt::format("AnalysisConfig.{}: {}", field, detail));
    }
}

}  // namespace

// ─── validate ─────────────────────────────────────────────────────────────────

void AnalysisConfig::validate() const {
    require(std::isfinite(b) && b > 0.0, "b",
            fmt::format("must be finite and > 0 (got {})", b));
    require(std::isfinite(dt) && dt > 0.0, "dt",
            fmt::format("must be finite and > 0 (got {})", dt));

    for (double s : seed) {
        require(std::isfinite(s), "seed",
                fmt::format("components must be finite (got {}, {}, {})",
                            seed[0], seed[1], seed[2]));
    }

    require(qr_period >= 1, "qr_period", "must be >= 1");
    require(window_size >= qr_period, "window_size",
            fmt::format("must be >= qr_period ({} < {})", window_size, qr_period));
    require(window_size % qr_period == 0, "window_size",
            fmt::format("must be a multiple of qr_period ({} % {} != 0)",
                        window_size, qr_period));
    require(convergence_check_interval >= 1, "convergence_check_interval",
            "must be >= 1");
    require(std::isfinite(tolerance) && tolerance > 0.0, "tolerance",
            fmt::format("must be finite and > 0 (got {})", tolerance));

    require(num_bootstrap >= 1, "num_bootstrap", "must be >= 1");
    require(confidence_level > 0.0 && confidence_level < 1.0, "confidence_level",
            fmt::format("must lie in (0, 1) (got {})", confidence_level));
    require(std::isfinite(sum_identity_tolerance) && sum_identity_tolerance > 0.0,
            "sum_identity_tolerance",
            fmt::format("must be finite and > 0 (got {})", sum_identity_tolerance));
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string AnalysisConfig::to_string() const {
    return fmt::format(
        "AnalysisConfig{{b={:.6f} dt={:g} seed=({:g}, {:g}, {:g}) qr_period={} "
        "window={} transient={} steps={} bootstrap={}@{:.2f}}}",
        b, dt, seed[0], seed[1], seed[2], qr_period,
        window_size, transient_steps, analysis_steps,
        num_bootstrap, confidence_level);
}

} // namespace tchaos
