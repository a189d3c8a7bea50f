/// @file src/wavenumber/wavenumber.cpp
/// @brief Wavenumber grids and magnetic directional factors.

#include "potfield/wavenumber.hpp"
#include "potfield/constants.hpp"
#include "potfield/errors.hpp"
#include "core/validation.hpp"

#include <cmath>
#include <numbers>
#include <string>

namespace potfield::wavenumber {

namespace {

/// Uniform spacing of `n` samples spanning [min, max].
double axis_spacing(double lo, double hi, Eigen::Index n, const char* axis) {
    if (n < 2) {
        return 1.0; // single sample: only the zero frequency exists
    }
    const double d = (hi - lo) / static_cast<double>(n - 1);
    if (!std::isfinite(d) || d == 0.0) {
        throw InvalidParameter(std::string("grid spacing along ") + axis +
                               " must be finite and non-zero");
    }
    return d;
}

} // anonymous namespace

// ─── WavenumberGrid ───────────────────────────────────────────────────────────

Grid WavenumberGrid::magnitude() const {
    return (kx.square() + ky.square()).sqrt();
}

// ─── Frequencies ──────────────────────────────────────────────────────────────

Eigen::ArrayXd fft_frequencies(Eigen::Index n, double d) {
    Eigen::ArrayXd f(n);
    const Eigen::Index positive = (n - 1) / 2; // last non-negative bin
    const double scale = 1.0 / (static_cast<double>(n) * d);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index bin = (i <= positive) ? i : i - n;
        f(i) = static_cast<double>(bin) * scale;
    }
    return f;
}

WavenumberGrid wavenumber(const Grid& x, const Grid& y) {
    if (!same_shape(x, y)) {
        throw InvalidShape("grid in x (" + detail::shape_string(x) +
                           ") and grid in y (" + detail::shape_string(y) +
                           ") must have the same shape");
    }
    if (x.size() == 0) {
        throw InvalidShape("grids must not be empty");
    }

    const Eigen::Index nx = x.rows();
    const Eigen::Index ny = x.cols();

    const double dx = axis_spacing(x.minCoeff(), x.maxCoeff(), nx, "x");
    const double dy = axis_spacing(y.minCoeff(), y.maxCoeff(), ny, "y");

    const Eigen::ArrayXd fx = 2.0 * std::numbers::pi * fft_frequencies(nx, dx);
    const Eigen::ArrayXd fy = 2.0 * std::numbers::pi * fft_frequencies(ny, dy);

    return WavenumberGrid{
        .kx = fx.replicate(1, ny),
        .ky = fy.transpose().replicate(nx, 1),
    };
}

// ─── Directional Factor ───────────────────────────────────────────────────────

ComplexGrid theta(const Direction& direction, const Grid& kx, const Grid& ky) {
    if (!same_shape(kx, ky)) {
        throw InvalidShape("wavenumber grids kx (" + detail::shape_string(kx) +
                           ") and ky (" + detail::shape_string(ky) +
                           ") must have the same shape");
    }

    const double inc = direction.inclination * constants::DEG2RAD;
    const double dec = direction.declination * constants::DEG2RAD;

    const Grid k = (kx.square() + ky.square()).sqrt();

    // Projection of the unit direction onto the horizontal wavenumber,
    // normalised by |k|. 0/0 at DC is intentional (see header).
    const Grid horizontal =
        std::cos(inc) * (std::cos(dec) * kx + std::sin(dec) * ky) / k;

    ComplexGrid out(kx.rows(), kx.cols());
    out.real().setConstant(std::sin(inc));
    out.imag() = horizontal;
    return out;
}

} // namespace potfield::wavenumber
