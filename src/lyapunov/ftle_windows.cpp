/// @file src/lyapunov/ftle_windows.cpp
/// @brief FtleWindowManager: ring buffer of finite-time Lyapunov estimates.

#include "tchaos/lyapunov.hpp"

#include <algorithm>
#include <cmath>

namespace tchaos::lyapunov {

// ─── FtleWindow ───────────────────────────────────────────────────────────────

bool FtleWindow::is_finite() const noexcept {
    return std::all_of(exponents.begin(), exponents.end(),
                       [](double x) { return std::isfinite(x); });
}

// ─── FtleWindowManager ────────────────────────────────────────────────────────

FtleWindowManager::FtleWindowManager(std::uint64_t window_size,
                                     double        dt,
                                     std::size_t   capacity) noexcept
    : window_size_(window_size < 1 ? 1 : window_size)
    , dt_(dt)
    , capacity_(capacity < 1 ? 1 : capacity) {}

void FtleWindowManager::accumulate(const Spectrum& log_growth) noexcept {
    for (std::size_t i = 0; i < open_.sums.size(); ++i) {
        open_.sums[i] += log_growth[i];
    }
}

bool FtleWindowManager::on_step(std::uint64_t step) noexcept {
    if (step < open_.start_step || step - open_.start_step < window_size_) {
        return false;
    }

    const std::uint64_t duration = step - open_.start_step;
    const double        elapsed  = static_cast<double>(duration) * dt_;

    FtleWindow closed{
        .start_step = open_.start_step,
        .end_step   = step,
        .exponents  = {},
        .duration   = duration,
    };
    for (std::size_t i = 0; i < closed.exponents.size(); ++i) {
        closed.exponents[i] = open_.sums[i] / elapsed;
    }

    windows_.push_back(closed);
    if (windows_.size() > capacity_) {
        windows_.pop_front();
    }

    open_ = OpenWindow{step, {}};
    return true;
}

std::vector<FtleWindow> FtleWindowManager::completed() const {
    return std::vector<FtleWindow>(windows_.begin(), windows_.end());
}

void FtleWindowManager::reset() noexcept {
    open_ = OpenWindow{0, {}};
    windows_.clear();
}

} // namespace tchaos::lyapunov
