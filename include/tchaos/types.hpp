#pragma once

/// @file include/tchaos/types.hpp
/// @brief Shared primitive types for the Thomas chaos analysis library.
///
/// All modules include this file. It defines the phase-space dimension and
/// the Eigen-based linear-algebra aliases used throughout the system.

#include <Eigen/Dense>
#include <array>

namespace tchaos {

/// Dimensionality of the Thomas phase space (x, y, z).
static constexpr int PHASE_DIM = 3;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A point (or tangent vector) in the 3-dimensional phase space.
using Vec3 = Eigen::Vector<double, PHASE_DIM>;

/// A 3×3 matrix: Jacobians, tangent bases and QR factors.
using Mat3 = Eigen::Matrix<double, PHASE_DIM, PHASE_DIM>;

// ─── Spectrum ─────────────────────────────────────────────────────────────────

/// One value per Lyapunov axis, in QR column order (axis 0 is the direction
/// of fastest growth once the basis has aligned).
using Spectrum = std::array<double, PHASE_DIM>;

} // namespace tchaos
