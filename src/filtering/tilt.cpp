/// @file src/filtering/tilt.cpp
/// @brief Tilt angle, theta map and hyperbolic tilt.
///
/// These operators build no frequency-domain operator of their own: the
/// spectral work happens in the Gradient Adapter and only the pointwise
/// combination lives here.

#include "potfield/filtering.hpp"
#include "potfield/derivative.hpp"
#include "core/validation.hpp"
#include "filtering/non_finite.hpp"

#include <cmath>

namespace potfield::filtering {

namespace {

/// atan2(∂z, |∇h|) elementwise.
Grid tilt_angle(const Grid& x, const Grid& y, const Grid& data) {
    const Grid hgrad  = derivative::horzgrad(x, y, data);
    const Grid derivz = derivative::zderiv(x, y, data, 1);

    return derivz.binaryExpr(hgrad, [](double dz, double dh) {
        return std::atan2(dz, dh);
    });
}

} // anonymous namespace

Grid tilt(const Grid& x, const Grid& y, const Grid& data) {
    detail::require_grid_shapes(x, y, data);
    return tilt_angle(x, y, data);
}

Grid thetamap(const Grid& x, const Grid& y, const Grid& data,
              const FilterOptions& options) {
    detail::require_grid_shapes(x, y, data);

    const Grid hgrad = derivative::horzgrad(x, y, data);
    const Grid tgrad = derivative::totalgrad(x, y, data);

    // No zero guard: a flat total gradient gives 0/0.
    const Grid ratio = hgrad / tgrad;
    detail::enforce_finite(ratio, options, "theta map");
    return ratio;
}

Grid hyperbolictilt(const Grid& x, const Grid& y, const Grid& data) {
    detail::require_grid_shapes(x, y, data);
    // Same angle as tilt(); only the real part is kept.
    const Grid hyptilt = tilt_angle(x, y, data);
    return hyptilt.real();
}

} // namespace potfield::filtering
