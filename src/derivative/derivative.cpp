/// @file src/derivative/derivative.cpp
/// @brief Spectral x/y/z derivatives and gradient magnitudes.

#include "potfield/derivative.hpp"
#include "potfield/fourier.hpp"
#include "potfield/wavenumber.hpp"
#include "potfield/errors.hpp"
#include "core/validation.hpp"

#include <string>

namespace potfield::derivative {

using fourier::Fourier2D;

namespace {

void require_order(int order) {
    if (order < 1) {
        throw InvalidParameter("derivative order must be at least 1 (got " +
                               std::to_string(order) + ")");
    }
}

/// Re(IFFT(FFT(data) · op)).
Grid apply_spectral(const Grid& data, const ComplexGrid& op) {
    const ComplexGrid spectrum = Fourier2D::forward(data) * op;
    return Fourier2D::inverse(spectrum).real();
}

/// (i·k)ⁿ by repeated multiplication; std::pow on complex goes through
/// log() and misbehaves at k = 0.
ComplexGrid ik_power(const Grid& k, int order) {
    const ComplexGrid ik = k.cast<Complex>() * Complex(0.0, 1.0);
    ComplexGrid out = ik;
    for (int n = 1; n < order; ++n) out *= ik;
    return out;
}

} // anonymous namespace

Grid xderiv(const Grid& x, const Grid& y, const Grid& data, int order) {
    detail::require_grid_shapes(x, y, data);
    require_order(order);
    const auto k = wavenumber::wavenumber(x, y);
    return apply_spectral(data, ik_power(k.kx, order));
}

Grid yderiv(const Grid& x, const Grid& y, const Grid& data, int order) {
    detail::require_grid_shapes(x, y, data);
    require_order(order);
    const auto k = wavenumber::wavenumber(x, y);
    return apply_spectral(data, ik_power(k.ky, order));
}

Grid zderiv(const Grid& x, const Grid& y, const Grid& data, int order) {
    detail::require_grid_shapes(x, y, data);
    require_order(order);
    const auto k = wavenumber::wavenumber(x, y);
    const Grid kz = k.magnitude().pow(static_cast<double>(order));
    return apply_spectral(data, kz.cast<Complex>());
}

Grid horzgrad(const Grid& x, const Grid& y, const Grid& data) {
    const Grid dx = xderiv(x, y, data, 1);
    const Grid dy = yderiv(x, y, data, 1);
    return (dx.square() + dy.square()).sqrt();
}

Grid totalgrad(const Grid& x, const Grid& y, const Grid& data) {
    const Grid dx = xderiv(x, y, data, 1);
    const Grid dy = yderiv(x, y, data, 1);
    const Grid dz = zderiv(x, y, data, 1);
    return (dx.square() + dy.square() + dz.square()).sqrt();
}

} // namespace potfield::derivative
