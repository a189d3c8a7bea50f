#pragma once

/// @file include/potfield/grid_io.hpp
/// @brief XYZ (x, y, value) CSV reader/writer for regular grids.
///
/// # Module: GridLoader
///
/// ## Responsibility
/// Turn scattered-order XYZ rows of a regular survey grid into the three
/// same-shape `Grid`s the filters consume, and write results back out.
///
/// ## Expected CSV Format
/// ```
/// x,y,value
/// 0,0,12.5
/// 0,50,13.1
/// 50,0,11.9
/// 50,50,12.2
/// ```
/// The first line is a header and is skipped. Rows may come in any order.
/// Blank lines and lines starting with '#' are ignored.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable input
/// - Malformed or non-finite rows are skipped
/// - Each axis is evenly spaced (relative tolerance 1e-6 on the step)
/// - The returned grids have x varying along rows and y along columns,
///   both ascending

#include "potfield/types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace potfield::io {

/// Coordinates and values of one regular grid, all the same shape.
struct GridData {
    Grid x;
    Grid y;
    Grid values;
};

/// Loads and writes XYZ grids.
class GridLoader {
public:
    /// Load a grid from a CSV file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or does not describe a
    ///   complete regular grid
    [[nodiscard]] static std::optional<GridData>
    load_xyz(const std::string& filepath) noexcept;

    /// Parse a grid from CSV text (same format as `load_xyz`).
    ///
    /// # Returns
    /// - `nullopt` if no valid row is present, a node is missing, a node
    ///   appears more than once, or an axis is not evenly spaced
    [[nodiscard]] static std::optional<GridData>
    parse_xyz_string(const std::string& csv_content) noexcept;

    /// Write `x,y,value` rows (with header) in row-major node order.
    ///
    /// # Returns
    /// false if the shapes disagree or the stream fails.
    static bool write_xyz(std::ostream& out, const Grid& x, const Grid& y,
                          const Grid& values);
};

} // namespace potfield::io
