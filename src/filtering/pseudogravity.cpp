/// @file src/filtering/pseudogravity.cpp
/// @brief Pseudogravity transform (Poisson's relation) of a total-field
///        magnetic anomaly.

#include "potfield/filtering.hpp"
#include "potfield/fourier.hpp"
#include "potfield/wavenumber.hpp"
#include "core/validation.hpp"
#include "filtering/fp_exception_mask.hpp"
#include "filtering/non_finite.hpp"

namespace potfield::filtering {

ComplexGrid pseudograv(const Grid& x, const Grid& y, const Grid& data,
                       const Direction& field,
                       const Direction& source,
                       double rho, double mag,
                       const PhysicalConstants& constants,
                       const FilterOptions& options) {
    detail::require_grid_shapes(x, y, data);
    detail::require_nonzero(rho, "density");
    detail::require_nonzero(mag, "magnetization");

    // nT → mGal scaling of Poisson's relation.
    const double c = (constants.gravitational_constant * rho *
                      constants.si_to_mgal) /
                     (constants.magnetization_constant * mag *
                      constants.tesla_to_nanotesla);

    const auto k = wavenumber::wavenumber(x, y);
    const Grid kr = k.magnitude();

    const ComplexGrid thetaf = wavenumber::theta(field,  k.kx, k.ky);
    const ComplexGrid thetas = wavenumber::theta(source, k.kx, k.ky);

    ComplexGrid prod;
    {
        detail::ScopedFpExceptionMask mask;
        prod = Complex(1.0, 0.0) / (thetaf * thetas * kr.cast<Complex>());
    }
    if (options.dc == DcTreatment::Zero) {
        prod(0, 0) = Complex(0.0, 0.0);
    }

    detail::enforce_finite(prod, options, "pseudogravity operator");

    ComplexGrid spectrum = fourier::Fourier2D::forward(data) * prod;
    spectrum *= c;
    return fourier::Fourier2D::inverse(spectrum);
}

ComplexGrid pseudograv(const Grid& x, const Grid& y, const Grid& data,
                       std::span<const double> field,
                       std::span<const double> source,
                       double rho, double mag,
                       const PhysicalConstants& constants,
                       const FilterOptions& options) {
    detail::require_grid_shapes(x, y, data);
    detail::require_same_size(field, source, "pseudogravity");

    return pseudograv(x, y, data,
                      Direction::from_components(field),
                      Direction::from_components(source),
                      rho, mag, constants, options);
}

} // namespace potfield::filtering
