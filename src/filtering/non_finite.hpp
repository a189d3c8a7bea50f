#pragma once

/// @file src/filtering/non_finite.hpp
/// @brief Strict-mode enforcement of finite operator values.

#include "potfield/config.hpp"
#include "potfield/errors.hpp"
#include "core/validation.hpp"

#include <string>

namespace potfield::detail {

/// In strict mode, throw NumericalDegeneracy if `values` holds any inf/NaN.
/// In propagate mode this is a no-op.
template <typename D>
void enforce_finite(const Eigen::ArrayBase<D>& values,
                    const FilterOptions& options,
                    const char* what) {
    if (options.non_finite != NonFinitePolicy::Strict) {
        return;
    }
    const std::size_t bad = count_non_finite(values);
    if (bad != 0) {
        throw NumericalDegeneracy(std::string(what) + ": " +
                                      std::to_string(bad) +
                                      " non-finite sample(s)",
                                  bad);
    }
}

} // namespace potfield::detail
