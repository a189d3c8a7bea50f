#pragma once

/// @file include/potfield/errors.hpp
/// @brief Exception taxonomy raised by the filtering operators.
///
/// All errors are precondition violations detected before any computation
/// starts, with one exception: `NumericalDegeneracy` is only raised when a
/// caller opts into strict non-finite checking (see `FilterOptions`).

#include <cstddef>
#include <stdexcept>
#include <string>

namespace potfield {

/// Root of every error thrown by the PotField library.
class FilterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A scalar argument is out of its domain (zero height, zero density,
/// malformed direction vector, degenerate grid spacing...).
class InvalidParameter : public FilterError {
public:
    using FilterError::FilterError;
};

/// Grid arguments of one call do not share a common, non-empty shape.
class InvalidShape : public FilterError {
public:
    using FilterError::FilterError;
};

/// Strict mode only: an operator produced non-finite samples.
class NumericalDegeneracy : public FilterError {
public:
    NumericalDegeneracy(const std::string& what, std::size_t non_finite_count)
        : FilterError(what), non_finite_count_(non_finite_count) {}

    /// Number of non-finite samples found.
    [[nodiscard]] std::size_t non_finite_count() const noexcept {
        return non_finite_count_;
    }

private:
    std::size_t non_finite_count_;
};

} // namespace potfield
