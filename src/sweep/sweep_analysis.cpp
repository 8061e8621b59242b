/// @file src/sweep/sweep_analysis.cpp
/// @brief Post-sweep analysis of the CTM(b) curve.

#include "tchaos/sweep.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace tchaos::sweep {

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string_view to_string(SweepStatus status) noexcept {
    switch (status) {
        case SweepStatus::Pending:   return "pending";
        case SweepStatus::Running:   return "running";
        case SweepStatus::Completed: return "completed";
        case SweepStatus::Error:     return "error";
        case SweepStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(CriticalPoint::Kind kind) noexcept {
    switch (kind) {
        case CriticalPoint::Kind::Maximum:    return "maximum";
        case CriticalPoint::Kind::Minimum:    return "minimum";
        case CriticalPoint::Kind::Inflection: return "inflection";
    }
    return "unknown";
}

// ─── curve ────────────────────────────────────────────────────────────────────

std::vector<CurvePoint> curve(std::span<const PointResult> points) {
    std::vector<CurvePoint> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        if (!p.ok || !p.metrics) continue;
        out.push_back(CurvePoint{
            .b          = p.b,
            .ctm        = p.metrics->ctm,
            .lambda1    = p.metrics->lambda1,
            .regime     = p.metrics->regime,
            .converged  = p.converged,
            .iterations = p.iterations,
        });
    }
    return out;
}

// ─── find_critical_points ─────────────────────────────────────────────────────

std::vector<CriticalPoint> find_critical_points(std::span<const CurvePoint> points) {
    std::vector<CriticalPoint> out;
    const std::size_t n = points.size();
    if (n < 3) return out;

    for (std::size_t i = 1; i + 1 < n; ++i) {
        const double prev = points[i - 1].ctm;
        const double curr = points[i].ctm;
        const double next = points[i + 1].ctm;

        if (curr > prev && curr > next) {
            out.push_back({CriticalPoint::Kind::Maximum, points[i].b, curr, i});
        }
        if (curr < prev && curr < next) {
            out.push_back({CriticalPoint::Kind::Minimum, points[i].b, curr, i});
        }

        // Second difference at i and at i − 1 must straddle zero.
        if (i > 1 && i + 2 < n) {
            const double d2      = next - 2.0 * curr + prev;
            const double d2_prev = curr - 2.0 * prev + points[i - 2].ctm;
            if (d2 * d2_prev < 0.0) {
                out.push_back({CriticalPoint::Kind::Inflection, points[i].b, curr, i});
            }
        }
    }
    return out;
}

// ─── find_transitions / find_chaos_onset ──────────────────────────────────────

std::vector<RegimeTransition> find_transitions(std::span<const CurvePoint> points) {
    std::vector<RegimeTransition> out;
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (points[i].regime != points[i - 1].regime) {
            out.push_back(RegimeTransition{
                .from  = points[i - 1].regime,
                .to    = points[i].regime,
                .b     = points[i].b,
                .ctm   = points[i].ctm,
                .index = i,
            });
        }
    }
    return out;
}

std::optional<ChaosOnset> find_chaos_onset(std::span<const CurvePoint> points) noexcept {
    for (const auto& p : points) {
        if (p.lambda1 > 0.0) {
            return ChaosOnset{.b = p.b, .lambda1 = p.lambda1, .ctm = p.ctm};
        }
    }
    return std::nullopt;
}

// ─── analyze ──────────────────────────────────────────────────────────────────

std::optional<SweepAnalysis> analyze(std::span<const PointResult> points) {
    const std::vector<CurvePoint> c = curve(points);
    if (c.empty()) return std::nullopt;

    double min_ctm = c.front().ctm;
    double max_ctm = c.front().ctm;
    double max_b   = c.front().b;
    double sum     = 0.0;
    std::size_t   converged = 0;
    std::uint64_t iter_sum  = 0;

    for (const auto& p : c) {
        min_ctm = std::min(min_ctm, p.ctm);
        if (p.ctm > max_ctm) {
            max_ctm = p.ctm;
            max_b   = p.b;
        }
        sum += p.ctm;
        if (p.converged) {
            ++converged;
            iter_sum += p.iterations;
        }
    }

    const double n = static_cast<double>(c.size());

    return SweepAnalysis{
        .critical_points = find_critical_points(c),
        .transitions     = find_transitions(c),
        .chaos_onset     = find_chaos_onset(c),
        .statistics = {
            .min_ctm            = min_ctm,
            .max_ctm            = max_ctm,
            .mean_ctm           = sum / n,
            .max_chaos_b        = max_b,
            .converged_ratio    = static_cast<double>(converged) / n,
            .average_iterations = converged > 0
                ? static_cast<double>(iter_sum) / static_cast<double>(converged)
                : 0.0,
            .evaluated_points   = points.size(),
            .failed_points      = points.size() - c.size(),
        },
    };
}

std::string SweepAnalysis::to_string() const {
    std::string out = fmt::format(
        "CTM range [{:.4f}, {:.4f}]  mean {:.4f}  max at b={:.4f}\n"
        "converged {:.0f}% (avg {:.0f} steps)  points {} ({} failed)\n",
        statistics.min_ctm, statistics.max_ctm, statistics.mean_ctm,
        statistics.max_chaos_b, statistics.converged_ratio * 100.0,
        statistics.average_iterations, statistics.evaluated_points,
        statistics.failed_points);

    if (chaos_onset) {
        out += fmt::format("chaos onset: b={:.4f} (λ1={:+.5f}, CTM={:.4f})\n",
                           chaos_onset->b, chaos_onset->lambda1, chaos_onset->ctm);
    } else {
        out += "chaos onset: none\n";
    }

    for (const auto& t : transitions) {
        out += fmt::format("transition at b={:.4f}: {} -> {}\n",
                           t.b, ctm::to_string(t.from), ctm::to_string(t.to));
    }
    for (const auto& cp : critical_points) {
        out += fmt::format("{} at b={:.4f} (CTM={:.4f})\n",
                           sweep::to_string(cp.kind), cp.b, cp.ctm);
    }
    return out;
}

} // namespace tchaos::sweep
