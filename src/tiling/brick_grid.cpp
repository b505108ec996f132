/// @file brick_grid.cpp
/// @brief Tiling construction: declination rows, per-row RA columns, names and areas.

#include "tiling/brick_grid.hpp"

#include "core/logger.hpp"
#include "tiling/brick_name.hpp"
#include "tiling/errors.hpp"

#include <glm/trigonometric.hpp>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <cstddef>

namespace skybricks::tiling
{

using astro_constants::kFullCircleDeg;
using astro_constants::kPoleDecDeg;

i16 BrickGrid::brick_quadrant(std::size_t row, std::size_t col) const
{
    if (row == 0)
    {
        return 1;
    }
    if (config.symmetric_polar_quadrant && row + 1 == rows.size())
    {
        return 1;
    }
    return static_cast<i16>((col % 2) + (row % 2) * 2);
}

// -----------------------------------------------------------------
// Build the grid
//
// 1. Row centers at -90 + k×size up to and including +90 (half-step
//    bound), edges half a step below each center plus one past the last,
//    with the outermost edges pinned to ±90.
// 2. Column count per row from the row edge nearer the equator, rounded
//    up to an even number. Polar rows are single caps.
// 3. Uniform RA partition of [0, 360] per row.
// 4. Area of each brick:
//      A = (deg(sin dec2) - deg(sin dec1)) × (ra2 - ra1)   [deg²]
// 5. Name from the brick center.
// -----------------------------------------------------------------

BrickGrid TilingBuilder::build(const TilingConfig& config)
{
    validate(config);

    const f64 size = config.brick_size_deg;
    const f64 half = size / 2.0;

    const std::vector<f64> dec_centers = arange(-kPoleDecDeg, kPoleDecDeg + half, size);
    std::vector<f64> dec_edges = arange(-kPoleDecDeg - half, kPoleDecDeg + size, size);

    if (dec_centers.size() < 2 || dec_edges.size() != dec_centers.size() + 1)
    {
        throw ConfigurationError(fmt::format(
            "brick size {} yields {} row centers and {} row edges", size,
            dec_centers.size(), dec_edges.size()));
    }

    // Poles
    dec_edges.front() = -kPoleDecDeg;
    dec_edges.back() = kPoleDecDeg;

    const std::size_t row_count = dec_centers.size();

    BrickGrid grid;
    grid.config = config;
    grid.rows.reserve(row_count);

    u32 first_cell = 0;
    for (std::size_t row = 0; row < row_count; ++row)
    {
        const bool polar = (row == 0 || row + 1 == row_count);
        const u32 col_count = polar ? 1U : column_count(dec_centers[row], size);

        grid.rows.push_back(BrickRow{
            .dec_center = dec_centers[row],
            .dec_min    = dec_edges[row],
            .dec_max    = dec_edges[row + 1],
            .first_cell = first_cell,
            .col_count  = col_count,
        });
        first_cell += col_count;
    }

    grid.cells.reserve(first_cell);

    for (const BrickRow& row : grid.rows)
    {
        const f64 dec_factor = glm::degrees(std::sin(glm::radians(row.dec_max))) -
                               glm::degrees(std::sin(glm::radians(row.dec_min)));

        const f64 ra_step = kFullCircleDeg / static_cast<f64>(row.col_count);

        for (u32 col = 0; col < row.col_count; ++col)
        {
            const f64 ra_min = static_cast<f64>(col) * ra_step;
            const f64 ra_max = (col + 1 == row.col_count) ? kFullCircleDeg
                                                          : static_cast<f64>(col + 1) * ra_step;
            const f64 ra_center = 0.5 * (ra_min + ra_max);

            grid.cells.push_back(BrickCell{
                .name      = encode_brick_name(ra_center, row.dec_center),
                .ra_center = ra_center,
                .ra_min    = ra_min,
                .ra_max    = ra_max,
                .area      = (ra_max - ra_min) * dec_factor,
            });
        }
    }

    SKB_CORE_INFO("TilingBuilder: brick size {}° -> {} rows, {} bricks",
                  size, grid.row_count(), grid.brick_count());

    return grid;
}

// -----------------------------------------------------------------
// Evenly spaced values. The length is ceil((stop - start) / step); every
// value is computed from the realized first step so that coordinates,
// and the names derived from them, are reproducible bit for bit.
// -----------------------------------------------------------------

std::vector<f64> TilingBuilder::arange(f64 start, f64 stop, f64 step)
{
    const f64 length = std::ceil((stop - start) / step);
    const auto count = length > 0.0 ? static_cast<std::size_t>(length) : std::size_t{0};
    const f64 delta = (start + step) - start;

    std::vector<f64> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        values.push_back(start + static_cast<f64>(i) * delta);
    }
    return values;
}

// -----------------------------------------------------------------
// n = 360/size × cos(|dec_center| - size/2)
// The edge nearer the equator is the widest, so no brick in the row is
// wider than size. Round n/2 up and double it for an even count.
// -----------------------------------------------------------------

u32 TilingBuilder::column_count(f64 dec_center, f64 brick_size)
{
    const f64 dec_low = std::abs(dec_center) - brick_size / 2.0;
    const f64 n = kFullCircleDeg / brick_size * std::cos(dec_low * astro_constants::kPi / 180.0);
    return static_cast<u32>(std::ceil(n / 2.0) * 2.0);
}

} // namespace skybricks::tiling
