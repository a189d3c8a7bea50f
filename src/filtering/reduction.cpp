/// @file src/filtering/reduction.cpp
/// @brief Change of field / magnetization direction (reduction to the pole
///        and its generalisations), after Blakely (1996).

#include "potfield/filtering.hpp"
#include "potfield/fourier.hpp"
#include "potfield/wavenumber.hpp"
#include "core/validation.hpp"
#include "filtering/fp_exception_mask.hpp"
#include "filtering/non_finite.hpp"

namespace potfield::filtering {

ComplexGrid reduction(const Grid& x, const Grid& y, const Grid& data,
                      const Direction& old_field,
                      const Direction& old_source,
                      const Direction& new_field,
                      const Direction& new_source,
                      const FilterOptions& options) {
    detail::require_grid_shapes(x, y, data);

    const auto k = wavenumber::wavenumber(x, y);

    const ComplexGrid f0 = wavenumber::theta(old_field,  k.kx, k.ky);
    const ComplexGrid m0 = wavenumber::theta(old_source, k.kx, k.ky);
    const ComplexGrid f1 = wavenumber::theta(new_field,  k.kx, k.ky);
    const ComplexGrid m1 = wavenumber::theta(new_source, k.kx, k.ky);

    ComplexGrid op;
    {
        detail::ScopedFpExceptionMask mask;
        op = (f1 * m1) / (f0 * m0);
    }
    // 0/0 at DC: the ratio is undefined there.
    op(0, 0) = Complex(0.0, 0.0);

    detail::enforce_finite(op, options, "reduction operator");

    const ComplexGrid spectrum = op * fourier::Fourier2D::forward(data);
    return fourier::Fourier2D::inverse(spectrum);
}

ComplexGrid reduction(const Grid& x, const Grid& y, const Grid& data,
                      std::span<const double> old_field,
                      std::span<const double> old_source,
                      std::span<const double> new_field,
                      std::span<const double> new_source,
                      const FilterOptions& options) {
    detail::require_grid_shapes(x, y, data);
    detail::require_same_size(old_field, new_field, "field");
    detail::require_same_size(old_source, new_source, "source");

    return reduction(x, y, data,
                     Direction::from_components(old_field),
                     Direction::from_components(old_source),
                     Direction::from_components(new_field),
                     Direction::from_components(new_source),
                     options);
}

} // namespace potfield::filtering
