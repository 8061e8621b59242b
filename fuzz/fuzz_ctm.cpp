/**
 * @file  fuzz_ctm.cpp
 * @brief libFuzzer target for CtmCalculator::compute and kaplan_yorke_dimension
 *
 * Build:
 *   cmake -DTCHAOS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_ctm
 *
 * Run for 60 seconds:
 *   ./fuzz_ctm -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. An invalid b is rejected with ValidationError and nothing else.
 *   3. Any NaN/Inf exponent gives nullopt.
 *   4. Finite exponents give a finite result with CTM ∈ [0, 1],
 *      D_KY ∈ [0, 3] and a regime consistent with (CTM, λ1).
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as four raw doubles (λ1, λ2, λ3, b)
 *   via memcpy, covering NaN, ±Inf, ±0, denormals and huge magnitudes.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>

#include "tchaos/ctm.hpp"
#include "tchaos/errors.hpp"

using namespace tchaos;
using namespace tchaos::ctm;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 4 * sizeof(double)) return 0;

    double v[4];
    std::memcpy(v, data, sizeof(v));
    const Spectrum lambda{v[0], v[1], v[2]};
    const double   b = v[3];

    // D_KY never leaves [0, 3] for finite input
    if (std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2])) {
        const double d = kaplan_yorke_dimension(lambda);
        assert(d >= 0.0);
        assert(d <= 3.0);
    }

    try {
        const CtmCalculator calc(b);
        assert(std::isfinite(b) && b > 0.0);

        const auto result = calc.compute(lambda);
        const bool finite = std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
        assert(result.has_value() == finite);

        if (result.has_value()) {
            assert(result->ctm >= 0.0);
            assert(result->ctm <= 1.0);
            assert(result->kaplan_yorke >= 0.0);
            assert(result->kaplan_yorke <= 3.0);
            assert(result->regime == classify_regime(result->ctm, result->lambda1));
            assert(result->exponents[0] >= result->exponents[1]);
            assert(result->exponents[1] >= result->exponents[2]);
            (void)result->to_string();
        }
    } catch (const ValidationError&) {
        assert(!(std::isfinite(b) && b > 0.0));
    }

    return 0;
}
