#pragma once

/// @file include/potfield/derivative.hpp
/// @brief Gradient Adapter: spectral derivatives of gridded potential data.
///
/// # Module: Gradient Adapter
///
/// ## Responsibility
/// Directional derivatives computed in the wavenumber domain:
///
///   ∂ⁿ/∂xⁿ ↔ (i·kx)ⁿ     ∂ⁿ/∂yⁿ ↔ (i·ky)ⁿ     ∂ⁿ/∂zⁿ ↔ |k|ⁿ
///
/// and the gradient magnitudes built from the first-order derivatives:
///
///   horzgrad  = √(∂x² + ∂y²)
///   totalgrad = √(∂x² + ∂y² + ∂z²)
///
/// Results are the real part of the inverse transform.
///
/// ## Guarantees
/// - Output shape equals `data` shape
/// - `horzgrad` and `totalgrad` are ≥ 0 wherever finite
///
/// ## Throws
/// - `InvalidShape` if x, y, data disagree in shape
/// - `InvalidParameter` if `order < 1`

#include "potfield/types.hpp"

namespace potfield::derivative {

/// n-th derivative along x (grid rows).
[[nodiscard]] Grid xderiv(const Grid& x, const Grid& y, const Grid& data,
                          int order = 1);

/// n-th derivative along y (grid columns).
[[nodiscard]] Grid yderiv(const Grid& x, const Grid& y, const Grid& data,
                          int order = 1);

/// n-th vertical derivative.
[[nodiscard]] Grid zderiv(const Grid& x, const Grid& y, const Grid& data,
                          int order = 1);

/// Horizontal gradient magnitude.
[[nodiscard]] Grid horzgrad(const Grid& x, const Grid& y, const Grid& data);

/// Total gradient magnitude (analytic signal amplitude).
[[nodiscard]] Grid totalgrad(const Grid& x, const Grid& y, const Grid& data);

} // namespace potfield::derivative
