/// @file brick_index.cpp
/// @brief Coordinate-to-brick lookup.

#include "tiling/brick_index.hpp"

#include "tiling/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace skybricks::tiling
{

namespace
{

using astro_constants::kFullCircleDeg;
using astro_constants::kPoleDecDeg;

void require_same_length(std::span<const f64> ras, std::span<const f64> decs)
{
    if (ras.size() != decs.size())
    {
        throw ShapeMismatchError(ras.size(), decs.size());
    }
}

/// Apply a single-coordinate lookup element-wise, preserving input order.
template <typename Lookup>
auto map_coordinates(std::span<const f64> ras, std::span<const f64> decs, Lookup&& lookup)
{
    require_same_length(ras, decs);

    std::vector<decltype(lookup(f64{}, f64{}))> out;
    out.reserve(ras.size());
    for (std::size_t i = 0; i < ras.size(); ++i)
    {
        out.push_back(lookup(ras[i], decs[i]));
    }
    return out;
}

/// Reject grids that locate() cannot index: at least the two polar rows,
/// no empty row, and rows that tile the cell arena contiguously.
BrickGrid require_consistent(BrickGrid grid)
{
    validate(grid.config);

    if (grid.rows.size() < 2)
    {
        throw ConfigurationError(fmt::format(
            "brick grid needs at least 2 rows, got {}", grid.rows.size()));
    }

    std::size_t next_cell = 0;
    for (std::size_t row = 0; row < grid.rows.size(); ++row)
    {
        const BrickRow& band = grid.rows[row];
        if (band.col_count == 0 || band.first_cell != next_cell)
        {
            throw ConfigurationError(fmt::format(
                "brick grid row {} does not continue the cell arena", row));
        }
        next_cell += band.col_count;
    }

    if (next_cell != grid.cells.size())
    {
        throw ConfigurationError(fmt::format(
            "brick grid rows cover {} cells, arena holds {}", next_cell, grid.cells.size()));
    }

    return grid;
}

} // anonymous namespace

BrickIndex::BrickIndex(const TilingConfig& config)
    : BrickIndex(TilingBuilder::build(config))
{
}

BrickIndex::BrickIndex(BrickGrid grid)
    : m_grid{require_consistent(std::move(grid))}
{
}

std::string BrickIndex::to_string() const
{
    return fmt::format("Bricks(bricksize={:4.2f})", brick_size_deg());
}

// -----------------------------------------------------------------
// locate
//
// Rows are uniform in Dec and columns uniform in RA within a row, so the
// brick follows in O(1):
//   row = floor((dec + 90 + size/2) / size)
//   col = floor(ra / 360 × col_count[row])
// Both are clamped to the last index so that dec = +90 and RA just below
// 360 stay inside the grid.
// -----------------------------------------------------------------

BrickLocation BrickIndex::locate(f64 ra, f64 dec) const
{
    if (!std::isfinite(dec) || dec < -kPoleDecDeg || dec > kPoleDecDeg)
    {
        throw OutOfRangeError(CoordinateKind::Declination, dec);
    }
    if (!std::isfinite(ra))
    {
        throw OutOfRangeError(CoordinateKind::RightAscension, ra);
    }

    const f64 size = brick_size_deg();
    const f64 ra_norm = normalize_ra(ra);

    const auto row = std::min(
        static_cast<std::size_t>((dec + kPoleDecDeg + size / 2.0) / size),
        m_grid.row_count() - 1);

    const std::size_t col_count = m_grid.rows[row].col_count;
    const auto col = std::min(
        static_cast<std::size_t>(ra_norm / kFullCircleDeg * static_cast<f64>(col_count)),
        col_count - 1);

    return BrickLocation{.row = row, .col = col};
}

std::string BrickIndex::name(f64 ra, f64 dec) const
{
    return cell(locate(ra, dec)).name;
}

i32 BrickIndex::id(f64 ra, f64 dec) const
{
    const auto loc = locate(ra, dec);
    return m_grid.brick_id(loc.row, loc.col);
}

i16 BrickIndex::quadrant(f64 ra, f64 dec) const
{
    const auto loc = locate(ra, dec);
    return m_grid.brick_quadrant(loc.row, loc.col);
}

f64 BrickIndex::area(f64 ra, f64 dec) const
{
    return cell(locate(ra, dec)).area;
}

BrickVertices BrickIndex::vertices(f64 ra, f64 dec) const
{
    const auto loc = locate(ra, dec);
    const BrickRow& row = m_grid.rows[loc.row];
    const BrickCell& brick = cell(loc);

    return BrickVertices{
        Vec2d{brick.ra_min, row.dec_min},
        Vec2d{brick.ra_max, row.dec_min},
        Vec2d{brick.ra_max, row.dec_max},
        Vec2d{brick.ra_min, row.dec_max},
    };
}

Vec2d BrickIndex::center(f64 ra, f64 dec) const
{
    const auto loc = locate(ra, dec);
    return Vec2d{cell(loc).ra_center, m_grid.rows[loc.row].dec_center};
}

// -----------------------------------------------------------------
// Batch forms
// -----------------------------------------------------------------

std::vector<BrickLocation> BrickIndex::locate(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return locate(ra, dec); });
}

std::vector<std::string> BrickIndex::names(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return name(ra, dec); });
}

std::vector<i32> BrickIndex::ids(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return id(ra, dec); });
}

std::vector<i16> BrickIndex::quadrants(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return quadrant(ra, dec); });
}

std::vector<f64> BrickIndex::areas(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return area(ra, dec); });
}

std::vector<BrickVertices> BrickIndex::vertices(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return vertices(ra, dec); });
}

std::vector<Vec2d> BrickIndex::centers(std::span<const f64> ras, std::span<const f64> decs) const
{
    return map_coordinates(ras, decs, [this](f64 ra, f64 dec) { return center(ra, dec); });
}

// -----------------------------------------------------------------
// Table (built once)
// -----------------------------------------------------------------

const BrickTable& BrickIndex::to_table() const
{
    std::call_once(m_table_once, [this] {
        m_table = std::make_unique<const BrickTable>(BrickTable::from_grid(m_grid));
    });
    return *m_table;
}

const BrickCell& BrickIndex::cell(const BrickLocation& loc) const
{
    return m_grid.cells[m_grid.rows[loc.row].first_cell + loc.col];
}

// -----------------------------------------------------------------
// Normalize RA to [0, 360). fmod of a tiny negative value plus 360 can
// round to exactly 360, which belongs to column 0.
// -----------------------------------------------------------------

f64 BrickIndex::normalize_ra(f64 ra)
{
    ra = std::fmod(ra, kFullCircleDeg);
    if (ra < 0.0)
    {
        ra += kFullCircleDeg;
    }
    if (ra >= kFullCircleDeg)
    {
        ra = 0.0;
    }
    return ra;
}

} // namespace skybricks::tiling
