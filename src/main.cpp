/// @file src/main.cpp
/// @brief PotField CLI entry point.
///
/// Usage:
///   potfield <operator> <grid.csv> [options]   Filter an XYZ grid
///   potfield --help                            Print usage
///
/// The filtered grid is written to stdout as x,y,value CSV (real part).

#include "potfield/config.hpp"
#include "potfield/errors.hpp"
#include "potfield/filtering.hpp"
#include "potfield/grid_io.hpp"

#include <fmt/core.h>

#include <cmath>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  potfield continuation   <grid.csv> --height H\n"
        "  potfield reduction      <grid.csv> --old-field I,D --old-source I,D\n"
        "                                     --new-field I,D --new-source I,D\n"
        "  potfield tilt           <grid.csv>\n"
        "  potfield thetamap       <grid.csv>\n"
        "  potfield hyperbolictilt <grid.csv>\n"
        "  potfield pseudograv     <grid.csv> --field I,D --source I,D --rho R --mag M\n"
        "                                     [--keep-dc-unguarded]\n"
        "\n"
        "Global options:\n"
        "  --strict   fail instead of emitting inf/NaN samples\n"
        "  --help     show this help\n"
        "\n"
        "Grid CSV format (header required, any row order):\n"
        "  x,y,value\n"
        "Angles are in degrees.\n"
    );
}

/// Parsed "--key value" pairs and bare "--flag"s.
struct Arguments {
    std::map<std::string, std::string> values;
    std::vector<std::string> flags;

    bool has_flag(const std::string& f) const {
        for (const auto& s : flags) if (s == f) return true;
        return false;
    }
};

const std::vector<std::string> kValueOptions = {
    "--height", "--old-field", "--old-source", "--new-field", "--new-source",
    "--field", "--source", "--rho", "--mag",
};

std::optional<Arguments> parse_options(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        const std::string opt(argv[i]);
        bool takes_value = false;
        for (const auto& v : kValueOptions) if (v == opt) takes_value = true;

        if (takes_value) {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", opt);
                return std::nullopt;
            }
            args.values[opt] = argv[++i];
        } else if (opt == "--strict" || opt == "--keep-dc-unguarded") {
            args.flags.push_back(opt);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", opt);
            return std::nullopt;
        }
    }
    return args;
}

std::optional<double> parse_number(const std::string& text) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// "inc,dec" → {inc, dec}; any component count is passed on so the library
/// reports malformed direction vectors itself.
std::optional<std::vector<double>> parse_direction(const std::string& text) {
    std::vector<double> out;
    std::string::size_type start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto end   = (comma == std::string::npos) ? text.size() : comma;
        auto v = parse_number(text.substr(start, end - start));
        if (!v) return std::nullopt;
        out.push_back(*v);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

std::optional<double> require_number(const Arguments& args, const std::string& key) {
    const auto it = args.values.find(key);
    if (it == args.values.end()) {
        fmt::print(stderr, "Error: missing {}\n", key);
        return std::nullopt;
    }
    auto v = parse_number(it->second);
    if (!v) fmt::print(stderr, "Error: {} expects a number, got '{}'\n", key, it->second);
    return v;
}

std::optional<std::vector<double>> require_direction(const Arguments& args,
                                                     const std::string& key) {
    const auto it = args.values.find(key);
    if (it == args.values.end()) {
        fmt::print(stderr, "Error: missing {}\n", key);
        return std::nullopt;
    }
    auto v = parse_direction(it->second);
    if (!v) fmt::print(stderr, "Error: {} expects inc,dec, got '{}'\n", key, it->second);
    return v;
}

/// Run one operator. Returns the real-valued result, or nullopt after
/// reporting a usage error.
std::optional<potfield::Grid> run_operator(const std::string& op,
                                           const potfield::io::GridData& grid,
                                           const Arguments& args) {
    namespace flt = potfield::filtering;

    potfield::FilterOptions options;
    if (args.has_flag("--strict")) {
        options.non_finite = potfield::NonFinitePolicy::Strict;
    }
    if (args.has_flag("--keep-dc-unguarded")) {
        options.dc = potfield::DcTreatment::Unguarded;
    }

    const auto& [x, y, data] = grid;

    if (op == "continuation") {
        const auto h = require_number(args, "--height");
        if (!h) return std::nullopt;
        return potfield::Grid(flt::continuation(x, y, data, *h).real());
    }
    if (op == "reduction") {
        const auto of = require_direction(args, "--old-field");
        const auto os = require_direction(args, "--old-source");
        const auto nf = require_direction(args, "--new-field");
        const auto ns = require_direction(args, "--new-source");
        if (!of || !os || !nf || !ns) return std::nullopt;
        const auto result = flt::reduction(x, y, data,
                                           std::span<const double>(*of),
                                           std::span<const double>(*os),
                                           std::span<const double>(*nf),
                                           std::span<const double>(*ns), options);
        return potfield::Grid(result.real());
    }
    if (op == "tilt") {
        return flt::tilt(x, y, data);
    }
    if (op == "thetamap") {
        return flt::thetamap(x, y, data, options);
    }
    if (op == "hyperbolictilt") {
        return flt::hyperbolictilt(x, y, data);
    }
    if (op == "pseudograv") {
        const auto f   = require_direction(args, "--field");
        const auto s   = require_direction(args, "--source");
        const auto rho = require_number(args, "--rho");
        const auto mag = require_number(args, "--mag");
        if (!f || !s || !rho || !mag) return std::nullopt;
        const auto result = flt::pseudograv(x, y, data,
                                            std::span<const double>(*f),
                                            std::span<const double>(*s), *rho, *mag,
                                            potfield::PhysicalConstants{}, options);
        return potfield::Grid(result.real());
    }

    fmt::print(stderr, "Unknown operator: {}\n", op);
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string op(argv[1]);

    if (op == "--help" || op == "-h") {
        print_usage();
        return 0;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a grid CSV file path\n", op);
        print_usage();
        return 1;
    }

    const std::string filepath(argv[2]);
    const auto args = parse_options(argc, argv, 3);
    if (!args) {
        print_usage();
        return 1;
    }

    const auto grid = potfield::io::GridLoader::load_xyz(filepath);
    if (!grid) {
        fmt::print(stderr, "Error: cannot read a regular grid from '{}'\n", filepath);
        return 1;
    }
    fmt::print(stderr, "Loaded {}x{} grid from '{}'\n",
               grid->values.rows(), grid->values.cols(), filepath);

    try {
        const auto result = run_operator(op, *grid, *args);
        if (!result) {
            return 1;
        }
        if (!potfield::io::GridLoader::write_xyz(std::cout, grid->x, grid->y, *result)) {
            fmt::print(stderr, "Error: failed to write result\n");
            return 1;
        }
    } catch (const potfield::InvalidShape& e) {
        fmt::print(stderr, "Invalid grid shape: {}\n", e.what());
        return 1;
    } catch (const potfield::InvalidParameter& e) {
        fmt::print(stderr, "Invalid parameter: {}\n", e.what());
        return 1;
    } catch (const potfield::NumericalDegeneracy& e) {
        fmt::print(stderr, "Numerical degeneracy ({} samples): {}\n",
                   e.non_finite_count(), e.what());
        return 1;
    }
    return 0;
}
