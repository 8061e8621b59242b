/// @file src/lyapunov/gram_schmidt.cpp
/// @brief Modified Gram-Schmidt QR of the tangent basis.
///
/// Column i is orthogonalized against q_0..q_{i−1} one projection at a time,
/// always projecting the running residual (not the original column). This
/// keeps the result orthonormal to machine precision even when the columns
/// have nearly collapsed onto the most unstable direction between passes.

#include "tchaos/lyapunov.hpp"

#include <algorithm>
#include <cmath>

namespace tchaos::lyapunov {

QrResult modified_gram_schmidt(const TangentBasis& basis, double floor) noexcept {
    QrResult out{
        .q          = TangentBasis::Zero(),
        .r          = Mat3::Zero(),
        .log_growth = {},
    };

    for (int i = 0; i < PHASE_DIM; ++i) {
        Vec3 v = basis.col(i);

        for (int j = 0; j < i; ++j) {
            const double proj = out.q.col(j).dot(v);
            out.r(j, i) = proj;
            v -= proj * out.q.col(j);
        }

        const double norm  = v.norm();
        const double rii   = std::max(norm, floor);
        out.r(i, i)        = rii;
        out.log_growth[static_cast<std::size_t>(i)] = std::log(rii);

        // A collapsed column keeps its (tiny) direction scaled by the floor;
        // the next pass re-orthogonalizes it.
        out.q.col(i) = v / rii;
    }

    return out;
}

double orthonormality_error(const TangentBasis& basis) noexcept {
    const Mat3 gram = basis.transpose() * basis - Mat3::Identity();
    return gram.cwiseAbs().maxCoeff();
}

} // namespace tchaos::lyapunov
