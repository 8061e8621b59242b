/// @file src/lyapunov/accumulator.cpp
/// @brief LyapunovAccumulator: whole-run Σ ln R_ii per axis.

#include "tchaos/lyapunov.hpp"

namespace tchaos::lyapunov {

LyapunovAccumulator::LyapunovAccumulator(double dt) noexcept
    : dt_(dt) {}

void LyapunovAccumulator::accumulate(const Spectrum& log_growth) noexcept {
    for (std::size_t i = 0; i < sums_.size(); ++i) {
        sums_[i] += log_growth[i];
    }
}

Spectrum LyapunovAccumulator::exponents() const noexcept {
    Spectrum out{};
    if (step_count_ == 0) return out;

    const double elapsed = static_cast<double>(step_count_) * dt_;
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = sums_[i] / elapsed;
    }
    return out;
}

void LyapunovAccumulator::reset() noexcept {
    sums_       = {};
    step_count_ = 0;
}

} // namespace tchaos::lyapunov
