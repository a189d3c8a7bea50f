/// @file tests/wavenumber/test_theta.cpp
/// @brief Unit tests for the magnetic directional factor θ.

#include <gtest/gtest.h>
#include "potfield/wavenumber.hpp"
#include "potfield/errors.hpp"
#include "test_grids.hpp"

#include <cmath>
#include <numbers>

using namespace potfield;
using potfield::wavenumber::WavenumberGrid;
using potfield::wavenumber::theta;
using potfield::testing::make_survey;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static WavenumberGrid grid_8x8() {
    const auto s = make_survey(8, 8);
    return potfield::wavenumber::wavenumber(s.x, s.y);
}

// ─── Vertical direction ───────────────────────────────────────────────────────

TEST(Theta, VerticalDirectionIsOneAwayFromDc) {
    const auto k = grid_8x8();
    const auto t = theta(Direction{.inclination = 90.0, .declination = 0.0}, k.kx, k.ky);

    for (Eigen::Index i = 0; i < 8; ++i)
        for (Eigen::Index j = 0; j < 8; ++j) {
            if (i == 0 && j == 0) continue;
            EXPECT_NEAR(t(i, j).real(), 1.0, 1e-15);
            EXPECT_NEAR(t(i, j).imag(), 0.0, 1e-15);
        }
}

TEST(Theta, DcTermIsUndefined) {
    const auto k = grid_8x8();
    const auto t = theta(Direction{.inclination = 60.0, .declination = 10.0}, k.kx, k.ky);
    EXPECT_DOUBLE_EQ(t(0, 0).real(), std::sin(60.0 * std::numbers::pi / 180.0));
    EXPECT_TRUE(std::isnan(t(0, 0).imag()));
}

// ─── Horizontal direction ─────────────────────────────────────────────────────

TEST(Theta, HorizontalNorthPointsAlongKx) {
    const auto k = grid_8x8();
    const auto t = theta(Direction{.inclination = 0.0, .declination = 0.0}, k.kx, k.ky);

    // +kx axis: i·1,  −kx axis: −i,  ky axis: 0.
    EXPECT_NEAR(t(1, 0).real(), 0.0, 1e-15);
    EXPECT_NEAR(t(1, 0).imag(), 1.0, 1e-15);
    EXPECT_NEAR(t(7, 0).imag(), -1.0, 1e-15);
    EXPECT_DOUBLE_EQ(std::abs(t(0, 3)), 0.0);
}

TEST(Theta, DeclinationRotatesTheProjection) {
    const auto k = grid_8x8();
    const auto t = theta(Direction{.inclination = 0.0, .declination = 90.0}, k.kx, k.ky);

    // East-pointing field: responds to ky, not kx.
    EXPECT_NEAR(t(0, 1).imag(), 1.0, 1e-15);
    EXPECT_NEAR(t(1, 0).imag(), 0.0, 1e-15);
}

TEST(Theta, ModulusAtMostOne) {
    const auto k = grid_8x8();
    const auto t = theta(Direction{.inclination = 35.0, .declination = -20.0}, k.kx, k.ky);
    for (Eigen::Index i = 0; i < 8; ++i)
        for (Eigen::Index j = 0; j < 8; ++j) {
            if (i == 0 && j == 0) continue;
            EXPECT_LE(std::abs(t(i, j)), 1.0 + 1e-12);
        }
}

TEST(Theta, MismatchedWavenumberShapesThrow) {
    const Grid kx = Grid::Zero(3, 3);
    const Grid ky = Grid::Zero(3, 4);
    EXPECT_THROW((void)theta(Direction{.inclination = 90.0, .declination = 0.0}, kx, ky),
                 InvalidShape);
}
