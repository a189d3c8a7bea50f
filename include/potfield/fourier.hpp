#pragma once

/// @file include/potfield/fourier.hpp
/// @brief 2D discrete Fourier transform over Eigen grids.
///
/// # Module: Fourier Adapter
///
/// ## Responsibility
/// Row-column 2D DFT built on the 1D transforms of Eigen's FFT module
/// (kissfft backend by default). Conventions follow the usual numerical
/// packages:
///
///   F[u,v] = Σ f[m,n] · exp(−2πi (um/M + vn/N))        (forward, unscaled)
///   f[m,n] = 1/(MN) Σ F[u,v] · exp(+2πi (um/M + vn/N)) (inverse, scaled)
///
/// so `inverse(forward(f)) == f` up to rounding.
///
/// ## Guarantees
/// - Output shape always equals input shape
/// - Inputs are never modified
///
/// ## NOT Responsible For
/// - Wavenumber layout of the bins (see wavenumber.hpp)

#include "potfield/types.hpp"

namespace potfield::fourier {

/// Static 2D transform helpers.
class Fourier2D {
public:
    Fourier2D() = delete;

    /// Forward transform of a real grid.
    [[nodiscard]] static ComplexGrid forward(const Grid& data);

    /// Forward transform of a complex grid.
    [[nodiscard]] static ComplexGrid forward(const ComplexGrid& data);

    /// Inverse transform, scaled by 1/(rows·cols).
    [[nodiscard]] static ComplexGrid inverse(const ComplexGrid& spectrum);
};

} // namespace potfield::fourier
