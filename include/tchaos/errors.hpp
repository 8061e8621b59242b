#pragma once

/// @file include/tchaos/errors.hpp
/// @brief Error taxonomy of the Thomas chaos library.
///
/// Only contract violations throw. Numerical degeneracy (a collapsing QR
/// diagonal) is absorbed by flooring, and an unconverged run is reported
/// through `is_converged = false`.

#include <stdexcept>
#include <string>

namespace tchaos {

/// Invalid input rejected at construction or validation time:
/// non-positive b or dt, a seed that is not three finite reals, or an
/// out-of-range configuration field. Values are never clamped.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A statistical estimator was asked for a result it has too little data for
/// (bootstrap with fewer than MIN_BOOTSTRAP_WINDOWS windows, a 0-1 test on a
/// series shorter than ZERO_ONE_MIN_SAMPLES).
class InsufficientDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tchaos
