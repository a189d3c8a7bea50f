#pragma once

/// @file include/potfield/config.hpp
/// @brief Runtime configuration for the filtering operators.
///
/// Configuration is passed by value into each call; nothing is global and
/// nothing is mutated, so two calls with equal inputs always agree.

#include "potfield/constants.hpp"

namespace potfield {

/// What an operator does when it produces non-finite samples.
enum class NonFinitePolicy {
    Propagate, ///< inf/NaN flow silently into the output (default)
    Strict,    ///< throw NumericalDegeneracy instead
};

/// Treatment of the zero-wavenumber (DC) term of the pseudogravity operator.
enum class DcTreatment {
    Zero,      ///< force the operator to 0 at DC (default)
    Unguarded, ///< leave 1/(θf·θs·0) in place; the result becomes non-finite
};

/// Immutable set of constants consumed by the pseudogravity transform.
///
/// Default-constructed values come from `potfield::constants`. Tests and
/// callers reproducing other toolchains may inject their own.
struct PhysicalConstants {
    double gravitational_constant = constants::GRAVITATIONAL_CONSTANT;
    double si_to_mgal             = constants::SI2MGAL;
    double magnetization_constant = constants::MAGNETIZATION_CONSTANT;
    double tesla_to_nanotesla     = constants::T2NT;
};

/// Per-call behaviour switches shared by all operators.
struct FilterOptions {
    NonFinitePolicy non_finite = NonFinitePolicy::Propagate;
    DcTreatment     dc         = DcTreatment::Zero;
};

} // namespace potfield
