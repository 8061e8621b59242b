/// @file src/lyapunov/convergence_monitor.cpp
/// @brief ConvergenceMonitor: sliding-window stability test on exponent
///        snapshots.
///
/// Each record() call:
///   1. Appends the snapshot and evicts the oldest beyond CONVERGENCE_HISTORY
///   2. Returns early (keeping the previous verdict) until the history is full
///      and the run is at least min_steps long
///   3. Averages the older and the newer CONVERGENCE_HALF_WINDOW snapshots
///   4. Declares convergence iff max_i |newer_i − older_i| < tolerance

#include "tchaos/lyapunov.hpp"

#include <algorithm>
#include <cmath>

namespace tchaos::lyapunov {

namespace {

Spectrum window_mean(const std::deque<ConvergenceSnapshot>& history,
                     std::size_t first,
                     std::size_t count) noexcept {
    Spectrum mean{};
    for (std::size_t k = first; k < first + count; ++k) {
        for (std::size_t i = 0; i < mean.size(); ++i) {
            mean[i] += history[k].exponents[i];
        }
    }
    for (double& m : mean) {
        m /= static_cast<double>(count);
    }
    return mean;
}

}  // namespace

ConvergenceMonitor::ConvergenceMonitor(std::uint64_t min_steps, double tolerance) noexcept
    : min_steps_(min_steps)
    , tolerance_(tolerance) {}

bool ConvergenceMonitor::record(std::uint64_t step, const Spectrum& exponents) noexcept {
    history_.push_back(ConvergenceSnapshot{step, exponents});
    if (history_.size() > constants::CONVERGENCE_HISTORY) {
        history_.pop_front();
    }

    if (history_.size() < constants::CONVERGENCE_HISTORY || step < min_steps_) {
        return converged_;
    }

    constexpr std::size_t half = constants::CONVERGENCE_HALF_WINDOW;
    const std::size_t newer_first = history_.size() - half;

    const Spectrum older = window_mean(history_, newer_first - half, half);
    const Spectrum newer = window_mean(history_, newer_first, half);

    double spread = 0.0;
    for (std::size_t i = 0; i < older.size(); ++i) {
        spread = std::max(spread, std::abs(newer[i] - older[i]));
    }

    spread_    = spread;
    converged_ = spread < tolerance_;
    return converged_;
}

void ConvergenceMonitor::reset() noexcept {
    history_.clear();
    spread_.reset();
    converged_ = false;
}

} // namespace tchaos::lyapunov
