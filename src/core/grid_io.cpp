/// @file src/core/grid_io.cpp
/// @brief XYZ CSV grid loader and writer.

#include "potfield/grid_io.hpp"

#include <fmt/format.h>

#include <array>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace potfield::io {

namespace {

/// Relative deviation from the mean step tolerated between neighbouring
/// coordinates (absorbs rounding in written survey files).
constexpr double kSpacingTolerance = 1e-6;

struct XyzRow {
    double x;
    double y;
    double value;
};

/// Scan one "x,y,value" line left to right with strtod. Any token that is
/// not a finite number, or a column count other than three, rejects the row.
std::optional<XyzRow> parse_row(const std::string& line) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    const auto is_blank = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };

    std::array<double, 3> fields{};
    const char* cursor = line.c_str();
    for (std::size_t col = 0; col < fields.size(); ++col) {
        char* stop = nullptr;
        const double val = std::strtod(cursor, &stop);
        if (stop == cursor || !std::isfinite(val)) {
            return std::nullopt;
        }
        while (is_blank(*stop)) ++stop;

        const bool last = (col + 1 == fields.size());
        if (last ? *stop != '\0' : *stop != ',') {
            return std::nullopt; // garbage, or wrong column count
        }
        fields[col] = val;
        cursor = stop + 1;
    }
    return XyzRow{.x = fields[0], .y = fields[1], .value = fields[2]};
}

/// True if the sorted distinct coordinates of `index` are evenly spaced.
bool evenly_spaced(const std::map<double, Eigen::Index>& index) {
    if (index.size() < 3) {
        return true;
    }
    const double lo   = index.begin()->first;
    const double hi   = index.rbegin()->first;
    const double step = (hi - lo) / static_cast<double>(index.size() - 1);
    const double tol  = kSpacingTolerance * step;

    double prev = lo;
    for (auto it = std::next(index.begin()); it != index.end(); ++it) {
        if (std::abs((it->first - prev) - step) > tol) {
            return false;
        }
        prev = it->first;
    }
    return true;
}

/// Assign consecutive indices to the sorted distinct keys of `index`.
Eigen::Index number_axis(std::map<double, Eigen::Index>& index) {
    Eigen::Index n = 0;
    for (auto& [coord, i] : index) i = n++;
    return n;
}

} // anonymous namespace

std::optional<GridData>
GridLoader::parse_xyz_string(const std::string& csv_content) noexcept {
    try {
        std::istringstream in(csv_content);
        std::string line;
        std::vector<XyzRow> rows;

        bool header_skipped = false;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!header_skipped) {
                if (!line.empty() && line[0] != '#') {
                    header_skipped = true;
                }
                continue;
            }
            if (auto row = parse_row(line)) {
                rows.push_back(*row);
            }
        }

        if (rows.empty()) {
            return std::nullopt;
        }

        std::map<double, Eigen::Index> xi;
        std::map<double, Eigen::Index> yi;
        for (const auto& r : rows) {
            xi.emplace(r.x, 0);
            yi.emplace(r.y, 0);
        }
        const Eigen::Index nx = number_axis(xi);
        const Eigen::Index ny = number_axis(yi);

        // The wavenumber grid assumes one constant step per axis.
        if (!evenly_spaced(xi) || !evenly_spaced(yi)) {
            return std::nullopt;
        }

        // Every node exactly once.
        if (static_cast<Eigen::Index>(rows.size()) != nx * ny) {
            return std::nullopt;
        }

        GridData grid{
            .x      = Grid(nx, ny),
            .y      = Grid(nx, ny),
            .values = Grid::Constant(nx, ny, std::nan("")),
        };
        Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic> seen =
            Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>::Constant(nx, ny, false);

        for (const auto& [coord, i] : xi) grid.x.row(i).setConstant(coord);
        for (const auto& [coord, j] : yi) grid.y.col(j).setConstant(coord);

        for (const auto& r : rows) {
            const Eigen::Index i = xi.at(r.x);
            const Eigen::Index j = yi.at(r.y);
            if (seen(i, j)) {
                return std::nullopt; // duplicated node
            }
            seen(i, j) = true;
            grid.values(i, j) = r.value;
        }
        return grid;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<GridData>
GridLoader::load_xyz(const std::string& filepath) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad()) {
            return std::nullopt;
        }
        return parse_xyz_string(contents.str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool GridLoader::write_xyz(std::ostream& out, const Grid& x, const Grid& y,
                           const Grid& values) {
    if (!same_shape(x, values) || !same_shape(y, values)) {
        return false;
    }

    out << "x,y,value\n";
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        for (Eigen::Index j = 0; j < values.cols(); ++j) {
            out << fmt::format("{},{},{}\n", x(i, j), y(i, j), values(i, j));
        }
    }
    return static_cast<bool>(out);
}

} // namespace potfield::io
