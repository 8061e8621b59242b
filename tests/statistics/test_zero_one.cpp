/// @file tests/statistics/test_zero_one.cpp
/// @brief Unit tests for the 0-1 test for chaos on synthetic series.

#include <gtest/gtest.h>
#include "tchaos/statistics.hpp"
#include "tchaos/errors.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <vector>

using namespace tchaos;
using namespace tchaos::stats;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> sine_series(std::size_t n, double omega = 0.1) {
    std::vector<double> v(n);
    for (std::size_t k = 0; k < n; ++k) v[k] = std::sin(omega * static_cast<double>(k));
    return v;
}

/// Fully chaotic logistic map x ← 4x(1 − x).
static std::vector<double> logistic_series(std::size_t n, double x0 = 0.3) {
    std::vector<double> v(n);
    double x = x0;
    for (auto& s : v) {
        x = 4.0 * x * (1.0 - x);
        s = x;
    }
    return v;
}

// ─── Verdict ──────────────────────────────────────────────────────────────────

TEST(ZeroOne_Classify, Thresholds) {
    EXPECT_EQ(classify_zero_one(0.95), ZeroOneVerdict::Chaotic);
    EXPECT_EQ(classify_zero_one(0.9), ZeroOneVerdict::Indeterminate);
    EXPECT_EQ(classify_zero_one(0.5), ZeroOneVerdict::Indeterminate);
    EXPECT_EQ(classify_zero_one(0.1), ZeroOneVerdict::Indeterminate);
    EXPECT_EQ(classify_zero_one(0.05), ZeroOneVerdict::Regular);
    EXPECT_EQ(classify_zero_one(-0.3), ZeroOneVerdict::Regular);
}

TEST(ZeroOne_Classify, Labels) {
    EXPECT_EQ(to_string(ZeroOneVerdict::Regular), "regular");
    EXPECT_EQ(to_string(ZeroOneVerdict::Indeterminate), "indeterminate");
    EXPECT_EQ(to_string(ZeroOneVerdict::Chaotic), "chaotic");
}

// ─── Preconditions ────────────────────────────────────────────────────────────

TEST(ZeroOne_Preconditions, ShortSeries_Throws) {
    EXPECT_THROW((void)zero_one_test(sine_series(99)), InsufficientDataError);
    EXPECT_NO_THROW((void)zero_one_test(sine_series(100)));
}

TEST(ZeroOne_Preconditions, ResonantFrequency_Throws) {
    const auto s = sine_series(500);
    EXPECT_THROW((void)zero_one_test(s, {.c = 0.0}), ValidationError);
    EXPECT_THROW((void)zero_one_test(s, {.c = 2.0 * std::numbers::pi}), ValidationError);
}

TEST(ZeroOne_Preconditions, BadCutFraction_Throws) {
    const auto s = sine_series(500);
    EXPECT_THROW((void)zero_one_test(s, {.cut_fraction = 0.0}), ValidationError);
    EXPECT_THROW((void)zero_one_test(s, {.cut_fraction = 0.6}), ValidationError);
}

TEST(ZeroOne_Preconditions, TooFewLags_Throws) {
    const auto s = sine_series(150);
    EXPECT_THROW((void)zero_one_test(s, {.cut_fraction = 0.01}), InsufficientDataError);
}

TEST(ZeroOne_Preconditions, NonFiniteSample_Throws) {
    auto s = sine_series(500);
    s[250] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((void)zero_one_test(s), ValidationError);
}

// ─── Regular series ───────────────────────────────────────────────────────────

TEST(ZeroOne_Regular, SineSeries_KNearZero) {
    const auto r = zero_one_test(sine_series(3000));
    EXPECT_LT(r.k, 0.1) << r.to_string();
    EXPECT_EQ(r.verdict, ZeroOneVerdict::Regular);
    EXPECT_TRUE(r.reliable);
    EXPECT_EQ(r.samples, 3000u);
    EXPECT_EQ(r.max_lag, 300u);
}

TEST(ZeroOne_Regular, ShortSine_RegularButUnreliable) {
    const auto r = zero_one_test(sine_series(200));
    EXPECT_EQ(r.verdict, ZeroOneVerdict::Regular);
    EXPECT_FALSE(r.reliable);
    EXPECT_NE(r.to_string().find("unreliable"), std::string::npos);
}

TEST(ZeroOne_Regular, SineWithOtherDriveFrequency_StillRegular) {
    const auto r = zero_one_test(sine_series(3000), {.c = 1.7});
    EXPECT_LT(r.k, 0.1) << r.to_string();
}

// ─── Chaotic series ───────────────────────────────────────────────────────────

TEST(ZeroOne_Chaotic, LogisticMap_KNearOne) {
    const auto r = zero_one_test(logistic_series(2000));
    EXPECT_GT(r.k, 0.9) << r.to_string();
    EXPECT_EQ(r.verdict, ZeroOneVerdict::Chaotic);
    EXPECT_TRUE(r.is_finite());
}

TEST(ZeroOne_Chaotic, KNeverLeavesUnitInterval) {
    for (double x0 : {0.1, 0.2, 0.37, 0.61}) {
        const auto r = zero_one_test(logistic_series(500, x0));
        EXPECT_GE(r.k, -1.0);
        EXPECT_LE(r.k, 1.0);
    }
}
