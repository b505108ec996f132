/// @file test_brick_index.cpp
/// @brief Unit tests for skybricks::tiling::BrickIndex.
///
/// Verifies coordinate lookup against reference bricks of the 0.25° tiling,
/// pole handling, coverage of the returned vertices, batch/single agreement,
/// and rejection of out-of-range input.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "tiling/brick_index.hpp"
#include "tiling/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace skybricks;
using namespace skybricks::tiling;

// =================================================================
// Shared 0.25° index (built once for the whole suite)
// =================================================================

static const BrickIndex& bricks()
{
    static const BrickIndex s_index;
    return s_index;
}

static constexpr f64 kAreaEps = 1e-9;
static constexpr f64 kEdgeTol = 1e-9;

// =================================================================
// Reference bricks
// =================================================================

TEST_CASE("Origin falls in row 360, column 0")
{
    const BrickLocation loc = bricks().locate(0.0, 0.0);
    CHECK(loc.row == 360);
    CHECK(loc.col == 0);

    CHECK(bricks().name(0.0, 0.0) == "0001p000");
    CHECK(bricks().id(0.0, 0.0) == 330368);
    CHECK(bricks().quadrant(0.0, 0.0) == 0);

    const Vec2d c = bricks().center(0.0, 0.0);
    CHECK(c.x == doctest::Approx(0.125));
    CHECK(c.y == doctest::Approx(0.0));
}

TEST_CASE("Nearby points in one brick share its name")
{
    CHECK(bricks().name(180.0, 0.0) == "1801p000");
    CHECK(bricks().name(180.0, 0.1) == "1801p000");
    CHECK(bricks().id(180.0, 0.0) == bricks().id(180.0, 0.1));
}

TEST_CASE("Brick at RA 37.123, Dec -5.987")
{
    const f64 ra = 37.123;
    const f64 dec = -5.987;

    CHECK(bricks().locate(ra, dec) == BrickLocation{.row = 336, .col = 147});
    CHECK(bricks().col_count(336) == 1434);
    CHECK(bricks().name(ra, dec) == "0370m060");
    CHECK(bricks().id(ra, dec) == 295999);
    CHECK(bricks().quadrant(ra, dec) == 1);
    CHECK(bricks().area(ra, dec) == doctest::Approx(0.062417642663572484).epsilon(kAreaEps));

    const Vec2d c = bricks().center(ra, dec);
    CHECK(c.x == doctest::Approx(37.029288702928866));
    CHECK(c.y == doctest::Approx(-6.0));
    CHECK(std::abs(c.y - dec) <= bricks().brick_size_deg() / 2.0);
    CHECK(std::abs(c.x - ra) <= 180.0 / static_cast<f64>(bricks().col_count(336)));
}

TEST_CASE("Other reference bricks")
{
    CHECK(bricks().name(12.3, 45.6) == "0122p455");
    CHECK(bricks().id(12.3, 45.6) == 566398);

    CHECK(bricks().name(250.0, -60.2) == "2499m602");
    CHECK(bricks().id(250.0, -60.2) == 44100);
    CHECK(bricks().quadrant(250.0, -60.2) == 2);

    CHECK(bricks().name(359.99, -0.01) == "3598p000");
    CHECK(bricks().id(359.99, -0.01) == 331807);
}

// =================================================================
// RA normalization
// =================================================================

TEST_CASE("RA is reduced modulo 360")
{
    CHECK(bricks().name(-10.0, 10.0) == "3499p100");
    CHECK(bricks().name(350.0, 10.0) == "3499p100");
    CHECK(bricks().name(710.0, 10.0) == bricks().name(350.0, 10.0));
    CHECK(bricks().name(360.0, 0.0) == bricks().name(0.0, 0.0));
    CHECK(bricks().locate(-1e-20, 0.0).col == 0);
}

// =================================================================
// Poles
// =================================================================

TEST_CASE("Poles map to single-column caps spanning all RA")
{
    for (const f64 ra : {0.0, 45.0, 180.0, 359.9})
    {
        CAPTURE(ra);

        const BrickLocation south = bricks().locate(ra, -90.0);
        CHECK(south.row == 0);
        CHECK(bricks().col_count(south.row) == 1);
        CHECK(bricks().id(ra, -90.0) == 1);
        CHECK(bricks().name(ra, -90.0) == "1800m900");
        CHECK(bricks().quadrant(ra, -90.0) == 1);

        const BrickLocation north = bricks().locate(ra, 90.0);
        CHECK(north.row == bricks().row_count() - 1);
        CHECK(bricks().col_count(north.row) == 1);
        CHECK(bricks().id(ra, 90.0) == 662174);
        CHECK(bricks().name(ra, 90.0) == "1800p900");

        for (const f64 dec : {-90.0, 90.0})
        {
            const BrickVertices v = bricks().vertices(ra, dec);
            CHECK(v[0].x == 0.0);
            CHECK(v[1].x == 360.0);
            CHECK(v[2].x == 360.0);
            CHECK(v[3].x == 0.0);
        }
    }
}

TEST_CASE("North pole quadrant follows the general rule unless made symmetric")
{
    // Row 720 is even, so the general rule gives 0
    CHECK(bricks().quadrant(0.0, 90.0) == 0);

    const BrickIndex symmetric({.brick_size_deg = 1.0, .symmetric_polar_quadrant = true});
    CHECK(symmetric.quadrant(0.0, 90.0) == 1);
    CHECK(symmetric.quadrant(0.0, -90.0) == 1);
}

TEST_CASE("Dec +90 stays in the last row when the bound rounds past it")
{
    // 180/120 + 0.5 is an integer, so the raw row formula overshoots
    const BrickIndex coarse({.brick_size_deg = 120.0});
    REQUIRE(coarse.row_count() == 2);
    CHECK(coarse.locate(10.0, 90.0).row == 1);
    CHECK(coarse.id(10.0, 90.0) == 2);
}

// =================================================================
// Vertices and coverage
// =================================================================

TEST_CASE("Vertices are counter-clockwise from the minimum corner")
{
    const BrickVertices v = bricks().vertices(37.123, -5.987);

    CHECK(v[0].x == doctest::Approx(36.90376569037657));
    CHECK(v[0].y == doctest::Approx(-6.125));
    CHECK(v[1].x == doctest::Approx(37.15481171548117));
    CHECK(v[1].y == doctest::Approx(-6.125));
    CHECK(v[2].x == doctest::Approx(37.15481171548117));
    CHECK(v[2].y == doctest::Approx(-5.875));
    CHECK(v[3].x == doctest::Approx(36.90376569037657));
    CHECK(v[3].y == doctest::Approx(-5.875));
}

TEST_CASE("Every coordinate lies inside the brick returned for it")
{
    for (const f64 size : {0.25, 0.7, 5.0})
    {
        const BrickIndex index({.brick_size_deg = size});
        CAPTURE(size);

        for (f64 dec = -89.99; dec <= 90.0; dec += 0.731)
        {
            for (f64 ra = 0.013; ra < 360.0; ra += 7.37)
            {
                const BrickVertices v = index.vertices(ra, dec);
                CAPTURE(ra);
                CAPTURE(dec);
                CHECK(v[0].x <= ra + kEdgeTol);
                CHECK(ra <= v[1].x + kEdgeTol);
                CHECK(v[0].y <= dec + kEdgeTol);
                CHECK(dec <= v[2].y + kEdgeTol);

                const Vec2d c = index.center(ra, dec);
                CHECK(c.x == doctest::Approx(0.5 * (v[0].x + v[1].x)));
            }
        }
    }
}

// =================================================================
// IDs
// =================================================================

TEST_CASE("Brick IDs run 1..N in row-major order")
{
    const BrickGrid& grid = bricks().grid();

    i32 expected = 0;
    bool in_order = true;
    for (std::size_t row = 0; row < grid.row_count(); ++row)
    {
        for (const BrickCell& cell : grid.row_cells(row))
        {
            ++expected;
            in_order = in_order && (bricks().id(cell.ra_center, grid.rows[row].dec_center) == expected);
        }
    }

    CHECK(in_order);
    CHECK(expected == static_cast<i32>(bricks().brick_count()));
}

// =================================================================
// Determinism and batch forms
// =================================================================

TEST_CASE("Lookups are pure functions of the coordinate and brick size")
{
    const BrickIndex again;

    for (const f64 dec : {-75.3, -1.0, 0.0, 33.3, 88.8})
    {
        CAPTURE(dec);
        CHECK(again.name(123.4, dec) == bricks().name(123.4, dec));
        CHECK(again.id(123.4, dec) == bricks().id(123.4, dec));
        CHECK(again.quadrant(123.4, dec) == bricks().quadrant(123.4, dec));
        CHECK(again.area(123.4, dec) == bricks().area(123.4, dec));
    }
}

TEST_CASE("Batch lookups agree with single lookups in input order")
{
    const std::vector<f64> ras{0.0, 180.0, 37.123, -10.0, 250.0, 0.0};
    const std::vector<f64> decs{0.0, 0.1, -5.987, 10.0, -60.2, 90.0};

    const auto names = bricks().names(ras, decs);
    const auto ids = bricks().ids(ras, decs);
    const auto quadrants = bricks().quadrants(ras, decs);
    const auto areas = bricks().areas(ras, decs);
    const auto vertices = bricks().vertices(ras, decs);
    const auto centers = bricks().centers(ras, decs);
    const auto locations = bricks().locate(ras, decs);

    REQUIRE(names.size() == ras.size());
    REQUIRE(ids.size() == ras.size());
    REQUIRE(quadrants.size() == ras.size());
    REQUIRE(areas.size() == ras.size());
    REQUIRE(vertices.size() == ras.size());
    REQUIRE(centers.size() == ras.size());
    REQUIRE(locations.size() == ras.size());

    for (std::size_t i = 0; i < ras.size(); ++i)
    {
        CAPTURE(i);
        CHECK(names[i] == bricks().name(ras[i], decs[i]));
        CHECK(ids[i] == bricks().id(ras[i], decs[i]));
        CHECK(quadrants[i] == bricks().quadrant(ras[i], decs[i]));
        CHECK(areas[i] == bricks().area(ras[i], decs[i]));
        CHECK(vertices[i] == bricks().vertices(ras[i], decs[i]));
        CHECK(centers[i] == bricks().center(ras[i], decs[i]));
        CHECK(locations[i] == bricks().locate(ras[i], decs[i]));
    }

    CHECK(names[0] == "0001p000");
    CHECK(names[5] == "1800p900");
}

TEST_CASE("Empty batches give empty results")
{
    const std::vector<f64> none;
    CHECK(bricks().names(none, none).empty());
    CHECK(bricks().ids(none, none).empty());
}

// =================================================================
// Errors
// =================================================================

TEST_CASE("Declination outside [-90, 90] is rejected")
{
    CHECK_THROWS_AS((void)bricks().name(0.0, 90.5), OutOfRangeError);
    CHECK_THROWS_AS((void)bricks().id(0.0, -91.0), OutOfRangeError);
    CHECK_THROWS_AS((void)bricks().area(0.0, std::numeric_limits<f64>::quiet_NaN()), OutOfRangeError);

    try
    {
        (void)bricks().locate(10.0, 95.0);
        FAIL("expected OutOfRangeError");
    }
    catch (const OutOfRangeError& e)
    {
        CHECK(e.kind() == CoordinateKind::Declination);
        CHECK(e.value() == 95.0);
    }
}

TEST_CASE("Non-finite right ascension is rejected")
{
    try
    {
        (void)bricks().locate(std::numeric_limits<f64>::infinity(), 0.0);
        FAIL("expected OutOfRangeError");
    }
    catch (const OutOfRangeError& e)
    {
        CHECK(e.kind() == CoordinateKind::RightAscension);
    }
}

TEST_CASE("Batch input with one bad coordinate throws")
{
    const std::vector<f64> ras{0.0, 10.0};
    const std::vector<f64> decs{0.0, -100.0};
    CHECK_THROWS_AS((void)bricks().names(ras, decs), OutOfRangeError);
}

TEST_CASE("Batch spans of different lengths are rejected")
{
    const std::vector<f64> ras{0.0, 10.0, 20.0};
    const std::vector<f64> decs{0.0, 10.0};
    CHECK_THROWS_AS((void)bricks().ids(ras, decs), ShapeMismatchError);
    CHECK_THROWS_AS((void)bricks().centers(ras, decs), BrickError);
}

TEST_CASE("Invalid brick size is rejected at construction")
{
    CHECK_THROWS_AS(BrickIndex({.brick_size_deg = 0.0}), ConfigurationError);
    CHECK_THROWS_AS(BrickIndex({.brick_size_deg = -0.25}), ConfigurationError);
}

TEST_CASE("Adopted grids are checked before use")
{
    SUBCASE("Empty grid")
    {
        CHECK_THROWS_AS(BrickIndex(BrickGrid{}), ConfigurationError);
    }

    SUBCASE("Invalid brick size")
    {
        BrickGrid grid = TilingBuilder::build({.brick_size_deg = 10.0});
        grid.config.brick_size_deg = 0.0;
        CHECK_THROWS_AS(BrickIndex(std::move(grid)), ConfigurationError);
    }

    SUBCASE("Rows that do not cover the cell arena")
    {
        BrickGrid grid = TilingBuilder::build({.brick_size_deg = 10.0});
        grid.cells.pop_back();
        CHECK_THROWS_AS(BrickIndex(std::move(grid)), ConfigurationError);
    }

    SUBCASE("Row with no bricks")
    {
        BrickGrid grid = TilingBuilder::build({.brick_size_deg = 10.0});
        grid.rows.back().col_count = 0;
        grid.cells.pop_back();
        CHECK_THROWS_AS(BrickIndex(std::move(grid)), ConfigurationError);
    }

    SUBCASE("A builder grid is accepted")
    {
        const BrickIndex index(TilingBuilder::build({.brick_size_deg = 10.0}));
        CHECK(index.name(0.0, -90.0) == "1800m900");
        CHECK(index.brick_count() == index.to_table().size());
    }
}

TEST_CASE("Column count of a row past the grid throws std::out_of_range")
{
    CHECK(bricks().col_count(bricks().row_count() - 1) == 1);
    CHECK_THROWS_AS((void)bricks().col_count(bricks().row_count()), std::out_of_range);
}

TEST_CASE("Text form shows the brick size")
{
    CHECK(bricks().to_string() == "Bricks(bricksize=0.25)");
}
