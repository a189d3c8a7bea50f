/// @file tests/integration/test_filter_pipeline.cpp
/// @brief End-to-end tests for the grid → filter → grid path.
///
/// These tests exercise the complete flow used by the CLI:
///   CSV text → GridLoader → filtering operator → write_xyz → GridLoader

#include "potfield/grid_io.hpp"
#include "potfield/filtering.hpp"
#include "potfield/errors.hpp"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace potfield;
using namespace potfield::io;
using namespace potfield::filtering;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// Survey of nx × ny stations spaced `step` metres apart, written with the
/// rows in reverse order so the loader has to sort them.
std::string make_survey_csv(int nx, int ny, double step) {
    const double kx = 2.0 * std::numbers::pi / (nx * step);
    const double ky = 2.0 * std::numbers::pi / (ny * step);

    std::string csv = "x,y,value\n";
    for (int i = nx - 1; i >= 0; --i) {
        for (int j = ny - 1; j >= 0; --j) {
            const double x = i * step;
            const double y = j * step;
            const double v = 50.0 + 20.0 * std::sin(kx * x) * std::cos(ky * y);
            csv += fmt::format("{},{},{}\n", x, y, v);
        }
    }
    return csv;
}

GridData load_or_fail(const std::string& csv) {
    auto g = GridLoader::parse_xyz_string(csv);
    if (!g) throw std::runtime_error("survey did not parse");
    return *g;
}

} // anonymous namespace

// ─── Tests ────────────────────────────────────────────────────────────────────

TEST(FilterPipeline, LoadedGridHasAscendingAxes) {
    const auto g = load_or_fail(make_survey_csv(16, 12, 50.0));
    ASSERT_EQ(g.values.rows(), 16);
    ASSERT_EQ(g.values.cols(), 12);
    EXPECT_DOUBLE_EQ(g.x(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(g.x(15, 0), 750.0);
    EXPECT_DOUBLE_EQ(g.y(0, 11), 550.0);
}

TEST(FilterPipeline, UpwardContinuationSurvivesWriteAndReload) {
    const auto g = load_or_fail(make_survey_csv(16, 12, 50.0));
    const Grid up = continuation(g.x, g.y, g.values, 100.0).real();

    std::ostringstream out;
    ASSERT_TRUE(GridLoader::write_xyz(out, g.x, g.y, up));

    const auto back = load_or_fail(out.str());
    ASSERT_EQ(back.values.rows(), up.rows());
    ASSERT_EQ(back.values.cols(), up.cols());
    EXPECT_LT((back.values - up).abs().maxCoeff(), 1e-9);
}

TEST(FilterPipeline, UpwardContinuationPreservesMeanAndShrinksAnomaly) {
    const auto g = load_or_fail(make_survey_csv(16, 12, 50.0));
    const Grid up = continuation(g.x, g.y, g.values, 200.0).real();

    EXPECT_NEAR(up.mean(), g.values.mean(), 1e-9);
    const double before = (g.values - g.values.mean()).abs().maxCoeff();
    const double after  = (up - up.mean()).abs().maxCoeff();
    EXPECT_LT(after, before);
}

TEST(FilterPipeline, ReductionToPoleThenTiltStaysBounded) {
    const auto g = load_or_fail(make_survey_csv(16, 16, 25.0));
    const Direction field{.inclination = -40.0, .declination = 12.0};
    const Direction pole{.inclination = 90.0, .declination = 0.0};

    const Grid rtp = reduction(g.x, g.y, g.values, field, field, pole, pole).real();
    ASSERT_TRUE(rtp.allFinite());

    const Grid t = tilt(g.x, g.y, rtp);
    EXPECT_LE(t.abs().maxCoeff(), std::numbers::pi / 2.0 + 1e-12);
}

TEST(FilterPipeline, PseudogravityOfLoadedGridIsFinite) {
    const auto g = load_or_fail(make_survey_csv(12, 12, 100.0));
    const Direction field{.inclination = 60.0, .declination = 5.0};

    const Grid pg = pseudograv(g.x, g.y, g.values, field, field, 300.0, 1.0).real();
    EXPECT_TRUE(pg.allFinite());
    EXPECT_NEAR(pg.mean(), 0.0, 1e-9);
}

TEST(FilterPipeline, ThetaMapIsBoundedOnLoadedSurvey) {
    const auto g = load_or_fail(make_survey_csv(12, 10, 10.0));
    const Grid th = thetamap(g.x, g.y, g.values);
    EXPECT_GE(th.minCoeff(), 0.0);
    EXPECT_LE(th.maxCoeff(), 1.0 + 1e-12);
}

TEST(FilterPipeline, IncompleteSurveyIsRejectedBeforeFiltering) {
    std::string csv = make_survey_csv(4, 4, 1.0);
    // Drop the last station.
    csv.erase(csv.rfind('\n', csv.size() - 2) + 1);
    EXPECT_FALSE(GridLoader::parse_xyz_string(csv).has_value());
}
