#pragma once

/// @file include/potfield/types.hpp
/// @brief Shared grid and direction types for the PotField filtering library.
///
/// Every module includes this file. Grids are Eigen arrays laid out as
/// (rows, cols) = (nx, ny): axis 0 runs along x (north), axis 1 along
/// y (east).

#include <Eigen/Dense>

#include <complex>
#include <span>

namespace potfield {

/// A real-valued regular grid (data, coordinates, wavenumbers).
using Grid = Eigen::ArrayXXd;

/// A complex-valued grid: spectra, frequency-domain operators and the
/// raw output of the Fourier-domain filters.
using ComplexGrid = Eigen::ArrayXXcd;

using Complex = std::complex<double>;

// ─── Magnetic Direction ───────────────────────────────────────────────────────

/// Direction of the geomagnetic field or of a source magnetization.
///
/// Both angles are in degrees. Inclination is positive below the horizontal,
/// declination is measured clockwise from x (north) towards y (east).
struct Direction {
    double inclination;
    double declination;

    /// Build a direction from a raw component vector `[inc, dec]`.
    ///
    /// Throws `InvalidParameter` unless exactly two components are given.
    static Direction from_components(std::span<const double> components);
};

/// True if two grids have the same number of rows and columns.
template <typename A, typename B>
[[nodiscard]] bool same_shape(const Eigen::ArrayBase<A>& a,
                              const Eigen::ArrayBase<B>& b) noexcept {
    return a.rows() == b.rows() && a.cols() == b.cols();
}

} // namespace potfield
