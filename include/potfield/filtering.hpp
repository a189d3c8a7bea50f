#pragma once

/// @file include/potfield/filtering.hpp
/// @brief Fourier-domain filters for gravity and magnetic anomaly grids.
///
/// # Module: Filtering
///
/// ## Responsibility
/// Each operator follows the same skeleton: transform the data grid to the
/// wavenumber domain, multiply by an analytically derived operator, invert.
///
/// | Operator         | Frequency-domain operator              |
/// |------------------|----------------------------------------|
/// | continuation     | exp(−H·|k|)                            |
/// | reduction        | (θf₁·θm₁) / (θf₀·θm₀), DC = 0          |
/// | pseudograv       | C / (θf·θs·|k|)                        |
///
/// The tilt family (tilt, thetamap, hyperbolictilt) combines the outputs of
/// the Gradient Adapter instead of building an operator of its own.
///
/// ## Guarantees
/// - Pure functions: inputs are never modified, nothing is cached
/// - Output shape always equals `data` shape
/// - Preconditions are checked before any computation; violations throw
///   `InvalidShape` / `InvalidParameter`
///
/// ## Non-finite Values
/// Singular points of the operators (zero directional factors, zero
/// gradients, the DC term of pseudogravity when left unguarded) produce
/// inf/NaN that propagate silently into the output. Set
/// `FilterOptions::non_finite = NonFinitePolicy::Strict` to get a
/// `NumericalDegeneracy` exception instead.
///
/// ## NOT Responsible For
/// - Wavenumber and directional factors (see wavenumber.hpp)
/// - Spectral derivatives (see derivative.hpp)
/// - Grid I/O (see grid_io.hpp)

#include "potfield/config.hpp"
#include "potfield/types.hpp"

#include <span>

namespace potfield::filtering {

// ─── Continuation ─────────────────────────────────────────────────────────────

/// Upward (H > 0) or downward (H < 0) continuation by `height`.
///
/// The same operator exp(−H·|k|) serves both directions. Downward
/// continuation amplifies high wavenumbers and is unstable for large |H|;
/// no stabilisation is applied.
///
/// # Returns
/// Complex grid whose real part is the continued field.
///
/// # Throws
/// - `InvalidParameter` if `height` is zero or non-finite
/// - `InvalidShape` if x, y, data disagree in shape
[[nodiscard]] ComplexGrid continuation(const Grid& x, const Grid& y,
                                       const Grid& data, double height);

/// Continuation of an already complex grid (e.g. a previous result).
[[nodiscard]] ComplexGrid continuation(const Grid& x, const Grid& y,
                                       const ComplexGrid& data, double height);

// ─── Reduction ────────────────────────────────────────────────────────────────

/// Re-express a magnetic anomaly observed under (old_field, old_source)
/// directions as the anomaly under (new_field, new_source). With
/// new_field = new_source = (90°, 0°) this is reduction to the pole.
///
/// The operator's DC term is forced to zero, so the mean of `data` is
/// removed. Zero directional factors elsewhere (e.g. zero inclination)
/// yield non-finite samples.
///
/// # Throws
/// - `InvalidShape` if x, y, data disagree in shape
/// - `NumericalDegeneracy` in strict mode if the operator is non-finite
[[nodiscard]] ComplexGrid reduction(const Grid& x, const Grid& y,
                                    const Grid& data,
                                    const Direction& old_field,
                                    const Direction& old_source,
                                    const Direction& new_field,
                                    const Direction& new_source,
                                    const FilterOptions& options = {});

/// Raw-vector form: each direction is `[inclination, declination]`.
///
/// # Throws
/// - `InvalidParameter` if old/new field (or old/new source) vectors differ
///   in size, or any vector does not have exactly two components
/// - as the `Direction` overload otherwise
[[nodiscard]] ComplexGrid reduction(const Grid& x, const Grid& y,
                                    const Grid& data,
                                    std::span<const double> old_field,
                                    std::span<const double> old_source,
                                    std::span<const double> new_field,
                                    std::span<const double> new_source,
                                    const FilterOptions& options = {});

// ─── Tilt Family ──────────────────────────────────────────────────────────────

/// Tilt angle atan2(∂z, |∇h|) in radians, within (−π, π].
[[nodiscard]] Grid tilt(const Grid& x, const Grid& y, const Grid& data);

/// Theta map |∇h| / |∇|. Zero total gradient gives NaN (strict mode
/// throws `NumericalDegeneracy`).
[[nodiscard]] Grid thetamap(const Grid& x, const Grid& y, const Grid& data,
                            const FilterOptions& options = {});

/// "Hyperbolic" tilt angle.
///
/// Computes the same atan2(∂z, |∇h|) as `tilt` and returns its real part;
/// no hyperbolic function is involved. The name is kept for compatibility
/// with existing processing scripts.
[[nodiscard]] Grid hyperbolictilt(const Grid& x, const Grid& y,
                                  const Grid& data);

// ─── Pseudogravity ────────────────────────────────────────────────────────────

/// Pseudogravity anomaly (mGal) from a total-field anomaly (nT).
///
/// C = G·rho·si2mGal / (cm·mag·t2nt), operator C / (θfield·θsource·|k|).
///
/// # Arguments
/// * `rho`      : density (kg/m³), non-zero
/// * `mag`      : magnetization intensity (A/m), non-zero
/// * `constants`: physical constants; defaults reproduce the standard table
/// * `options`  : `dc` selects zeroing (default) or leaving the singular DC
///              term in place
///
/// # Throws
/// - `InvalidShape` if x, y, data disagree in shape
/// - `InvalidParameter` if rho or mag is zero or non-finite
/// - `NumericalDegeneracy` in strict mode if the operator is non-finite
[[nodiscard]] ComplexGrid pseudograv(const Grid& x, const Grid& y,
                                     const Grid& data,
                                     const Direction& field,
                                     const Direction& source,
                                     double rho, double mag,
                                     const PhysicalConstants& constants = {},
                                     const FilterOptions& options = {});

/// Raw-vector form.
///
/// # Throws
/// - `InvalidParameter` if `field` and `source` differ in size or do not
///   have exactly two components
[[nodiscard]] ComplexGrid pseudograv(const Grid& x, const Grid& y,
                                     const Grid& data,
                                     std::span<const double> field,
                                     std::span<const double> source,
                                     double rho, double mag,
                                     const PhysicalConstants& constants = {},
                                     const FilterOptions& options = {});

} // namespace potfield::filtering
