/// @file src/lyapunov/tangent_evolver.cpp
/// @brief RK4 integration of the variational equation dV/dt = J(x(t))·V.
///
/// The trajectory step supplies its four stage positions; J is evaluated at
/// each one so the tangent flow is advanced with the same fourth-order scheme
/// as the trajectory itself. All three tangent vectors are stepped at once as
/// the columns of V.

#include "tchaos/lyapunov.hpp"

namespace tchaos::lyapunov {

TangentBasis evolve_tangent_basis(const TangentBasis&        basis,
                                  const model::ThomasModel&  model,
                                  const std::array<Vec3, 4>& stages,
                                  double                     dt) noexcept {
    const double h = dt;

    const Mat3 j1 = model.jacobian(stages[0]);
    const Mat3 j2 = model.jacobian(stages[1]);
    const Mat3 j3 = model.jacobian(stages[2]);
    const Mat3 j4 = model.jacobian(stages[3]);

    const TangentBasis k1 = j1 * basis;
    const TangentBasis k2 = j2 * (basis + (h / 2.0) * k1);
    const TangentBasis k3 = j3 * (basis + (h / 2.0) * k2);
    const TangentBasis k4 = j4 * (basis + h * k3);

    return basis + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

} // namespace tchaos::lyapunov
