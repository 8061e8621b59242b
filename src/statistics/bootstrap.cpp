/// @file src/statistics/bootstrap.cpp
/// @brief Percentile bootstrap over FTLE windows and per-axis exponent CIs.
///
/// Each resample:
///   1. Draws windows.size() indices uniformly with replacement
///   2. Averages the drawn window exponents per axis
///   3. Recomputes the full ChaosMetricResult at b
/// CTM, λ1 and D_KY of all resamples are then summarized with the
/// percentile method.

#include "tchaos/statistics.hpp"
#include "tchaos/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <random>
#include <vector>

namespace tchaos::stats {

namespace {

bool valid_level(double level) noexcept {
    return level > 0.0 && level < 1.0;
}

/// Sample standard deviation (Bessel-corrected); 0 for fewer than 2 values.
double sample_std(std::span<const double> v, double mean) noexcept {
    if (v.size() < 2) return 0.0;
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

Spectrum mean_spectrum(std::span<const lyapunov::FtleWindow> windows,
                       std::span<const std::size_t>          picks) noexcept {
    Spectrum mean{};
    for (std::size_t idx : picks) {
        for (std::size_t i = 0; i < mean.size(); ++i) {
            mean[i] += windows[idx].exponents[i];
        }
    }
    for (double& m : mean) {
        m /= static_cast<double>(picks.size());
    }
    return mean;
}

}  // namespace

// ─── percentile_interval / summarize ──────────────────────────────────────────

std::optional<ConfidenceInterval>
percentile_interval(std::span<const double> sorted, double level) noexcept {
    if (sorted.empty() || !valid_level(level)) return std::nullopt;

    const double n     = static_cast<double>(sorted.size());
    const double alpha = 1.0 - level;

    auto lower_idx = static_cast<std::size_t>(std::floor(n * alpha / 2.0));
    auto upper_raw = static_cast<long long>(std::ceil(n * (1.0 - alpha / 2.0))) - 1;

    const std::size_t last = sorted.size() - 1;
    lower_idx = std::min(lower_idx, last);
    std::size_t upper_idx = upper_raw < 0 ? 0 : static_cast<std::size_t>(upper_raw);
    upper_idx = std::clamp(upper_idx, lower_idx, last);

    return ConfidenceInterval{
        .lower   = sorted[lower_idx],
        .upper   = sorted[upper_idx],
        .level   = level,
        .samples = sorted.size(),
    };
}

std::optional<SampleSummary> summarize(std::span<const double> values, double level) {
    if (values.empty() || !valid_level(level)) return std::nullopt;
    for (double x : values) {
        if (!std::isfinite(x)) return std::nullopt;
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const double mean = std::accumulate(sorted.begin(), sorted.end(), 0.0)
                      / static_cast<double>(sorted.size());

    const auto ci = percentile_interval(sorted, level);
    if (!ci) return std::nullopt;

    return SampleSummary{
        .mean   = mean,
        .stddev = sample_std(sorted, mean),
        .median = sorted[sorted.size() / 2],
        .min    = sorted.front(),
        .max    = sorted.back(),
        .ci     = *ci,
    };
}

// ─── BootstrapConfig ──────────────────────────────────────────────────────────

void BootstrapConfig::validate() const {
    if (num_bootstrap == 0) {
        throw ValidationError("BootstrapConfig.num_bootstrap: must be >= 1");
    }
    if (!valid_level(confidence_level)) {
        throw ValidationError(fmt::format(
            "BootstrapConfig.confidence_level: must lie in (0, 1) (got {})",
            confidence_level));
    }
    if (!std::isfinite(sum_tolerance) || sum_tolerance <= 0.0) {
        throw ValidationError(fmt::format(
            "BootstrapConfig.sum_tolerance: must be finite and > 0 (got {})",
            sum_tolerance));
    }
}

// ─── BootstrapResult ──────────────────────────────────────────────────────────

bool BootstrapResult::is_finite() const noexcept {
    auto finite = [](const SampleSummary& s) {
        return std::isfinite(s.mean) && std::isfinite(s.stddev)
            && std::isfinite(s.ci.lower) && std::isfinite(s.ci.upper);
    };
    return point_estimate.is_finite()
        && representative.is_finite()
        && finite(ctm_stats)
        && finite(lambda1_stats)
        && finite(kaplan_yorke_stats);
}

std::string BootstrapResult::to_string() const {
    return fmt::format(
        "bootstrap[{} windows × {} resamples @ {:.0f}%]  "
        "CTM={:.4f} [{:.4f}, {:.4f}]  λ1={:+.5f} [{:+.5f}, {:+.5f}]  "
        "D_KY={:.4f} [{:.4f}, {:.4f}]",
        windows, resamples, ctm_stats.ci.level * 100.0,
        point_estimate.ctm, ctm_stats.ci.lower, ctm_stats.ci.upper,
        point_estimate.lambda1, lambda1_stats.ci.lower, lambda1_stats.ci.upper,
        point_estimate.kaplan_yorke, kaplan_yorke_stats.ci.lower,
        kaplan_yorke_stats.ci.upper);
}

// ─── bootstrap_ctm ────────────────────────────────────────────────────────────

BootstrapResult bootstrap_ctm(std::span<const lyapunov::FtleWindow> windows,
                              double                                b,
                              const BootstrapConfig&                config) {
    config.validate();

    if (windows.size() < constants::MIN_BOOTSTRAP_WINDOWS) {
        throw InsufficientDataError(fmt::format(
            "bootstrap needs at least {} FTLE windows (got {})",
            constants::MIN_BOOTSTRAP_WINDOWS, windows.size()));
    }
    for (const auto& w : windows) {
        if (!w.is_finite()) {
            throw ValidationError(fmt::format(
                "FTLE window [{}, {}) has non-finite exponents", w.start_step, w.end_step));
        }
    }

    const ctm::CtmCalculator calc(b, config.sum_tolerance);

    std::vector<std::size_t> all(windows.size());
    std::iota(all.begin(), all.end(), std::size_t{0});

    const auto point = calc.compute(mean_spectrum(windows, all));
    if (!point) {
        throw ValidationError("bootstrap: mean window spectrum is not finite");
    }

    std::mt19937_64 rng(config.rng_seed);
    std::uniform_int_distribution<std::size_t> pick(0, windows.size() - 1);

    std::vector<ctm::ChaosMetricResult> samples;
    samples.reserve(config.num_bootstrap);
    std::vector<std::size_t> draw(windows.size());

    for (std::size_t r = 0; r < config.num_bootstrap; ++r) {
        for (auto& idx : draw) {
            idx = pick(rng);
        }
        if (auto res = calc.compute(mean_spectrum(windows, draw))) {
            samples.push_back(*res);
        }
    }

    std::vector<double> ctm_values, lambda1_values, dky_values;
    ctm_values.reserve(samples.size());
    lambda1_values.reserve(samples.size());
    dky_values.reserve(samples.size());
    for (const auto& s : samples) {
        ctm_values.push_back(s.ctm);
        lambda1_values.push_back(s.lambda1);
        dky_values.push_back(s.kaplan_yorke);
    }

    const auto ctm_summary = summarize(ctm_values, config.confidence_level);
    const auto l1_summary  = summarize(lambda1_values, config.confidence_level);
    const auto dky_summary = summarize(dky_values, config.confidence_level);
    if (!ctm_summary || !l1_summary || !dky_summary) {
        throw ValidationError("bootstrap: resampled statistics are not finite");
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const auto& a, const auto& c) { return a.ctm < c.ctm; });

    return BootstrapResult{
        .point_estimate     = *point,
        .representative     = samples[samples.size() / 2],
        .ctm_stats          = *ctm_summary,
        .lambda1_stats      = *l1_summary,
        .kaplan_yorke_stats = *dky_summary,
        .windows            = windows.size(),
        .resamples          = samples.size(),
    };
}

// ─── exponent_confidence ──────────────────────────────────────────────────────

ExponentConfidence exponent_confidence(std::span<const lyapunov::FtleWindow> windows,
                                       const Spectrum&                       estimate,
                                       double                                level) {
    if (!valid_level(level)) {
        throw ValidationError(fmt::format(
            "exponent_confidence: level must lie in (0, 1) (got {})", level));
    }

    ExponentConfidence out{};
    const bool enough = windows.size() >= constants::MIN_BOOTSTRAP_WINDOWS;

    for (std::size_t axis = 0; axis < out.size(); ++axis) {
        const double lambda = estimate[axis];
        out[axis] = AxisConfidence{
            .estimate = lambda,
            .stddev   = 0.0,
            .ci       = {.lower = lambda, .upper = lambda, .level = level,
                         .samples = windows.size()},
        };
        if (!enough) continue;

        std::vector<double> values;
        values.reserve(windows.size());
        for (const auto& w : windows) {
            if (std::isfinite(w.exponents[axis])) values.push_back(w.exponents[axis]);
        }

        const auto summary = summarize(values, level);
        if (!summary) continue;

        out[axis].stddev = summary->stddev;
        out[axis].ci     = summary->ci;
    }
    return out;
}

} // namespace tchaos::stats
