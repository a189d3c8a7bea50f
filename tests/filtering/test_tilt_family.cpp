/// @file tests/filtering/test_tilt_family.cpp
/// @brief Unit tests for tilt, thetamap and hyperbolictilt.
///
/// For f = sin(k0 x):  ∂z f = k0 sin(k0 x),  |∇h f| = k0 |cos(k0 x)|,
/// |∇f| = k0. So tilt = atan2(sin, |cos|) and thetamap = |cos(k0 x)|.

#include <gtest/gtest.h>
#include "potfield/filtering.hpp"
#include "potfield/errors.hpp"
#include "test_grids.hpp"

#include <cmath>
#include <numbers>

using namespace potfield;
using namespace potfield::filtering;
using namespace potfield::testing;

static constexpr double PI = std::numbers::pi;

// ─── tilt ─────────────────────────────────────────────────────────────────────

TEST(Tilt, SineAnomalyAngles) {
    const auto s = make_survey(16, 8);
    const Grid data = sine_along_x(s);
    const Grid t = tilt(s.x, s.y, data);

    // x = 0: sin = 0, cos = 1 → 0.  x = N/4: sin = 1, cos = 0 → π/2.
    EXPECT_NEAR(t(0, 0), 0.0, 1e-9);
    EXPECT_NEAR(t(4, 3), PI / 2.0, 1e-6);
    EXPECT_NEAR(t(12, 5), -PI / 2.0, 1e-6);
    EXPECT_NEAR(t(2, 0), std::atan2(std::sin(PI / 4.0), std::cos(PI / 4.0)), 1e-9);
}

TEST(Tilt, WithinHalfOpenPiRange) {
    const auto s = make_survey(12, 14);
    const Grid t = tilt(s.x, s.y, mixed_anomaly(s));
    EXPECT_TRUE((t > -PI).all());
    EXPECT_TRUE((t <= PI).all());
}

TEST(Tilt, NonNegativeHorizontalGradientKeepsAngleWithinHalfPi) {
    const auto s = make_survey(12, 14);
    const Grid t = tilt(s.x, s.y, mixed_anomaly(s));
    EXPECT_LE(t.abs().maxCoeff(), PI / 2.0 + 1e-12);
}

TEST(Tilt, ShapeMismatchThrows) {
    const auto s = make_survey(4, 4);
    const Grid data = Grid::Ones(4, 3);
    EXPECT_THROW((void)tilt(s.x, s.y, data), InvalidShape);
}

// ─── thetamap ─────────────────────────────────────────────────────────────────

TEST(ThetaMap, SineAnomalyIsAbsCosine) {
    const auto s = make_survey(16, 8);
    const Grid data = sine_along_x(s);
    const Grid th = thetamap(s.x, s.y, data);

    const double k0 = fundamental(16, 1.0);
    const Grid expected = (k0 * s.x).cos().abs();
    EXPECT_LT((th - expected).abs().maxCoeff(), 1e-9);
}

TEST(ThetaMap, RatioBetweenZeroAndOne) {
    const auto s = make_survey(10, 10);
    const Grid th = thetamap(s.x, s.y, mixed_anomaly(s));
    EXPECT_GE(th.minCoeff(), 0.0);
    EXPECT_LE(th.maxCoeff(), 1.0 + 1e-12);
}

TEST(ThetaMap, ZeroGridPropagatesNaN) {
    const auto s = make_survey(6, 6);
    const Grid data = Grid::Zero(6, 6);
    Grid th;
    EXPECT_NO_THROW(th = thetamap(s.x, s.y, data));
    EXPECT_TRUE(th.isNaN().all());
}

TEST(ThetaMap, ZeroGridThrowsInStrictMode) {
    const auto s = make_survey(6, 6);
    const Grid data = Grid::Zero(6, 6);
    const FilterOptions strict{.non_finite = NonFinitePolicy::Strict};
    try {
        (void)thetamap(s.x, s.y, data, strict);
        FAIL() << "expected NumericalDegeneracy";
    } catch (const NumericalDegeneracy& e) {
        EXPECT_EQ(e.non_finite_count(), 36u);
    }
}

TEST(ThetaMap, ShapeMismatchThrows) {
    const auto s = make_survey(4, 4);
    const Grid data = Grid::Ones(3, 4);
    EXPECT_THROW((void)thetamap(s.x, s.y, data), InvalidShape);
}

// ─── hyperbolictilt ───────────────────────────────────────────────────────────

TEST(HyperbolicTilt, EqualsTiltSampleForSample) {
    const auto s = make_survey(12, 9);
    const Grid data = mixed_anomaly(s);
    const Grid t = tilt(s.x, s.y, data);
    const Grid h = hyperbolictilt(s.x, s.y, data);

    ASSERT_EQ(h.rows(), t.rows());
    ASSERT_EQ(h.cols(), t.cols());
    for (Eigen::Index i = 0; i < t.rows(); ++i)
        for (Eigen::Index j = 0; j < t.cols(); ++j)
            EXPECT_DOUBLE_EQ(h(i, j), t(i, j));
}

TEST(HyperbolicTilt, ShapeMismatchThrows) {
    const auto s = make_survey(4, 4);
    const Grid data = Grid::Ones(4, 5);
    EXPECT_THROW((void)hyperbolictilt(s.x, s.y, data), InvalidShape);
}
