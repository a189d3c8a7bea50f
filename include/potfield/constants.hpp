#pragma once

/// @file include/potfield/constants.hpp
/// @brief Physical constants and unit conversions used by the filters.
///
/// Values are fixed: results must be numerically reproducible against
/// existing processing chains, so do not "update" them to newer CODATA
/// releases.

#include <numbers>

namespace potfield::constants {

// ─── Unit Conversions ─────────────────────────────────────────────────────────

/// Tesla to nanoTesla.
static constexpr double T2NT = 1.0e9;

/// SI acceleration (m/s²) to mGal.
static constexpr double SI2MGAL = 1.0e5;

/// Degrees to radians.
static constexpr double DEG2RAD = std::numbers::pi / 180.0;

// ─── Physical Constants ───────────────────────────────────────────────────────

/// Newtonian gravitational constant (m³ kg⁻¹ s⁻²).
static constexpr double GRAVITATIONAL_CONSTANT = 6.673e-11;

/// Magnetization constant μ₀/4π (H/m).
static constexpr double MAGNETIZATION_CONSTANT = 1.0e-7;

} // namespace potfield::constants
