/**
 * @file  fuzz_zero_one.cpp
 * @brief libFuzzer target for stats::zero_one_test
 *
 * Build:
 *   cmake -DTCHAOS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_zero_one
 *
 * Run for 60 seconds:
 *   ./fuzz_zero_one -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. Rejections are InsufficientDataError (short series, too few lags)
 *      or ValidationError (NaN/Inf sample, resonant c, bad cut fraction).
 *   3. Otherwise K ∈ [−1, 1] and the verdict matches classify_zero_one(K).
 *
 * Fuzzer strategy:
 *   The first byte selects the drive frequency c ∈ (0, 2π] on a 256-step
 *   lattice (including the resonant 2π); the second selects the cut
 *   fraction. The remaining bytes are read as raw doubles via memcpy.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>
#include <numbers>
#include <vector>

#include "tchaos/errors.hpp"
#include "tchaos/statistics.hpp"

using namespace tchaos;
using namespace tchaos::stats;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    ZeroOneConfig cfg;
    cfg.c            = (static_cast<double>(data[0]) + 1.0) / 256.0 * 2.0 * std::numbers::pi;
    cfg.cut_fraction = static_cast<double>(data[1]) / 255.0 * 0.6;

    const size_t n_doubles = (size - 2) / sizeof(double);
    std::vector<double> series(n_doubles);
    if (n_doubles > 0) {
        std::memcpy(series.data(), data + 2, n_doubles * sizeof(double));
    }

    try {
        const ZeroOneResult r = zero_one_test(series, cfg);
        assert(r.k >= -1.0);
        assert(r.k <= 1.0);
        assert(r.verdict == classify_zero_one(r.k));
        assert(r.samples == series.size());
        assert(r.max_lag >= 2);
        (void)r.to_string();
    } catch (const InsufficientDataError&) {
        // Expected for short inputs
    } catch (const ValidationError&) {
        // Expected for NaN/Inf samples and invalid configurations
    }

    return 0;
}
