/// @file src/filtering/continuation.cpp
/// @brief Upward / downward continuation.

#include "potfield/filtering.hpp"
#include "potfield/fourier.hpp"
#include "potfield/wavenumber.hpp"
#include "potfield/errors.hpp"
#include "core/validation.hpp"

#include <cmath>

namespace potfield::filtering {

namespace {

void require_height(double height) {
    if (!std::isfinite(height)) {
        throw InvalidParameter("height must be finite");
    }
    if (height == 0.0) {
        throw InvalidParameter("height must differ from zero");
    }
}

/// exp(−H·|k|) · FFT(data), inverted.
template <typename D>
ComplexGrid continue_spectrum(const Grid& x, const Grid& y,
                              const D& data, double height) {
    const auto k = wavenumber::wavenumber(x, y);

    // H > 0 attenuates (upward), H < 0 amplifies (downward): one formula.
    const Grid kcont = (-height * k.magnitude()).exp();

    const ComplexGrid spectrum =
        fourier::Fourier2D::forward(data) * kcont.cast<Complex>();
    return fourier::Fourier2D::inverse(spectrum);
}

} // anonymous namespace

ComplexGrid continuation(const Grid& x, const Grid& y,
                         const Grid& data, double height) {
    require_height(height);
    detail::require_grid_shapes(x, y, data);
    return continue_spectrum(x, y, data, height);
}

ComplexGrid continuation(const Grid& x, const Grid& y,
                         const ComplexGrid& data, double height) {
    require_height(height);
    detail::require_grid_shapes(x, y, data);
    return continue_spectrum(x, y, data, height);
}

} // namespace potfield::filtering
