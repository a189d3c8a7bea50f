#pragma once

/// @file include/potfield/wavenumber.hpp
/// @brief Wavenumber Domain Adapter: spatial grids → frequency-domain grids.
///
/// # Module: Wavenumber Domain Adapter
///
/// ## Responsibility
/// - `wavenumber` turns the coordinate grids of a regular survey into the
///   angular wavenumber grids (kx, ky) conjugate to them, laid out in the
///   same bin order as `Fourier2D::forward`.
/// - `theta` builds the Fourier-domain directional factor of a magnetic
///   field or magnetization direction (Blakely, 1996):
///
///       θ(k) = sin I + i · cos I · (cos D · kx + sin D · ky) / |k|
///
/// ## Edge Cases
/// - θ at the zero wavenumber is 0/0: its imaginary part is NaN. Callers
///   decide what the DC term means for their operator.
/// - A grid axis with a single sample has only the zero wavenumber.

#include "potfield/types.hpp"

namespace potfield::wavenumber {

/// Angular wavenumbers (radians per coordinate unit) of every FFT bin.
struct WavenumberGrid {
    Grid kx; ///< varies along rows (x axis), constant along columns
    Grid ky; ///< varies along columns (y axis), constant along rows

    /// Radial wavenumber |k| = √(kx² + ky²).
    [[nodiscard]] Grid magnitude() const;
};

/// Sample frequencies of an n-point DFT with spacing `d`, in cycles per
/// unit, ordered [0, 1, ..., ⌈n/2⌉−1, −⌊n/2⌋, ..., −1] / (n·d).
[[nodiscard]] Eigen::ArrayXd fft_frequencies(Eigen::Index n, double d);

/// Compute (kx, ky) for the coordinate grids `x` and `y`.
///
/// Spacing is taken from the coordinate extents:
/// dx = (max x − min x)/(nx − 1), dy = (max y − min y)/(ny − 1).
///
/// # Throws
/// - `InvalidShape` if `x` and `y` differ in shape or are empty
/// - `InvalidParameter` if an axis with more than one sample has zero or
///   non-finite spacing
[[nodiscard]] WavenumberGrid wavenumber(const Grid& x, const Grid& y);

/// Directional factor θ for `direction` over the given wavenumber grids.
///
/// # Throws
/// - `InvalidShape` if `kx` and `ky` differ in shape
[[nodiscard]] ComplexGrid theta(const Direction& direction,
                                const Grid& kx,
                                const Grid& ky);

} // namespace potfield::wavenumber
