/**
 * @file  prop_tilt_range.cpp
 * @brief Property: tilt and hyperbolic tilt lie in [−π/2, π/2] and agree;
 *        the theta map lies in [0, 1] wherever it is finite.
 *
 * Run with more cases:
 *   RC_PARAMS="max_success=2000" ./prop_tilt_range
 *
 * Mathematical basis:
 *   tilt = atan2(∂z f, |∇h f|) with |∇h f| ≥ 0, so the angle never leaves
 *   the right half-plane. theta = |∇h f| / |∇f| ≤ 1 since |∇f|² adds ∂z².
 */

#include <rapidcheck.h>
#include <cmath>
#include <numbers>

#include "potfield/filtering.hpp"

using namespace potfield;
using namespace potfield::filtering;

int main() {
    constexpr double HALF_PI = std::numbers::pi / 2.0;

    rc::check(
        "tilt_range: tilt within [-pi/2, pi/2], theta map within [0, 1]",
        [&]() {
            const int nx = *rc::gen::inRange(2, 17);
            const int ny = *rc::gen::inRange(2, 17);

            Grid x(nx, ny), y(nx, ny), data(nx, ny);
            for (int i = 0; i < nx; ++i) {
                for (int j = 0; j < ny; ++j) {
                    x(i, j) = 25.0 * i;
                    y(i, j) = 25.0 * j;
                    data(i, j) = *rc::gen::inRange(-500, 501) / 10.0;
                }
            }

            const Grid t  = tilt(x, y, data);
            const Grid ht = hyperbolictilt(x, y, data);
            const Grid th = thetamap(x, y, data);

            RC_ASSERT(t.allFinite());
            RC_ASSERT(t.abs().maxCoeff() <= HALF_PI + 1e-12);
            RC_ASSERT((t == ht).all());

            for (Eigen::Index i = 0; i < th.size(); ++i) {
                const double v = th(i);
                if (!std::isfinite(v)) continue;
                RC_ASSERT(v >= 0.0);
                RC_ASSERT(v <= 1.0 + 1e-12);
            }
        }
    );

    return 0;
}
