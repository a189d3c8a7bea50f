#pragma once

/// @file src/core/validation.hpp
/// @brief Precondition checks shared by the adapters and operators.
///
/// Internal header. Every check throws before any computation starts.

#include "potfield/errors.hpp"
#include "potfield/types.hpp"

#include <cmath>
#include <cstddef>
#include <span>
#include <string>

namespace potfield::detail {

/// "RxC" for error messages.
template <typename A>
std::string shape_string(const Eigen::ArrayBase<A>& a) {
    return std::to_string(a.rows()) + "x" + std::to_string(a.cols());
}

/// Throw InvalidShape unless x, y and data share one non-empty shape.
template <typename D>
void require_grid_shapes(const Grid& x, const Grid& y,
                         const Eigen::ArrayBase<D>& data) {
    if (!same_shape(x, data)) {
        throw InvalidShape("grid in x (" + shape_string(x) +
                           ") and data (" + shape_string(data) +
                           ") must have the same shape");
    }
    if (!same_shape(y, data)) {
        throw InvalidShape("grid in y (" + shape_string(y) +
                           ") and data (" + shape_string(data) +
                           ") must have the same shape");
    }
    if (data.size() == 0) {
        throw InvalidShape("grids must not be empty");
    }
}

/// Throw InvalidParameter unless `value` is finite and non-zero.
inline void require_nonzero(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(std::string(name) + " must be finite");
    }
    if (value == 0.0) {
        throw InvalidParameter(std::string(name) + " must not be zero");
    }
}

/// Throw InvalidParameter unless two direction vectors have equal length.
inline void require_same_size(std::span<const double> a,
                              std::span<const double> b,
                              const char* what) {
    if (a.size() != b.size()) {
        throw InvalidParameter(std::string(what) +
                               ": direction vectors must have the same size (" +
                               std::to_string(a.size()) + " vs " +
                               std::to_string(b.size()) + ")");
    }
}

/// Number of inf/NaN samples in a grid.
template <typename D>
std::size_t count_non_finite(const Eigen::ArrayBase<D>& a) {
    std::size_t n = 0;
    for (Eigen::Index j = 0; j < a.cols(); ++j) {
        for (Eigen::Index i = 0; i < a.rows(); ++i) {
            const auto v = a(i, j);
            if (!std::isfinite(std::real(v)) || !std::isfinite(std::imag(v))) ++n;
        }
    }
    return n;
}

} // namespace potfield::detail
