#pragma once

/// @file brick_grid.hpp
/// @brief Immutable row/column partition of the sphere and the builder that computes it.

#include "core/types.hpp"
#include "tiling/tiling_config.hpp"

#include <span>
#include <string>
#include <vector>

namespace skybricks::tiling
{
    /// @brief One brick of a row. All angles in degrees.
    struct BrickCell
    {
        std::string name;   ///< 8-character brick name
        f64 ra_center;      ///< Right ascension of the brick center
        f64 ra_min;         ///< Lower RA edge
        f64 ra_max;         ///< Upper RA edge
        f64 area;           ///< Spherical area (square degrees)
    };

    /// @brief One band of constant declination range.
    struct BrickRow
    {
        f64 dec_center;     ///< Declination of the row center (±90 for polar rows)
        f64 dec_min;        ///< Lower Dec edge
        f64 dec_max;        ///< Upper Dec edge
        u32 first_cell;     ///< Offset of this row's first brick in BrickGrid::cells
        u32 col_count;      ///< Bricks in this row: even, or 1 for polar rows
    };

    /// @brief Complete tiling for one brick size.
    ///
    /// Bricks live in one row-major arena; each row owns the contiguous
    /// slice [first_cell, first_cell + col_count).
    struct BrickGrid
    {
        TilingConfig config;
        std::vector<BrickRow> rows;
        std::vector<BrickCell> cells;

        [[nodiscard]] f64 brick_size_deg() const { return config.brick_size_deg; }
        [[nodiscard]] std::size_t row_count() const { return rows.size(); }
        [[nodiscard]] std::size_t brick_count() const { return cells.size(); }

        /// @brief The bricks of one row, ordered by increasing RA.
        [[nodiscard]] std::span<const BrickCell> row_cells(std::size_t row) const
        {
            return std::span<const BrickCell>(cells).subspan(rows[row].first_cell, rows[row].col_count);
        }

        /// @brief 1-based row-major BRICKID.
        [[nodiscard]] i32 brick_id(std::size_t row, std::size_t col) const
        {
            return static_cast<i32>(rows[row].first_cell + col + 1);
        }

        /// @brief BRICKQ: position in the 2×2 stitching pattern.
        ///
        /// Row 0 is always 1. The north polar row follows the general rule
        /// (col % 2) + (row % 2) × 2 unless config.symmetric_polar_quadrant is set.
        [[nodiscard]] i16 brick_quadrant(std::size_t row, std::size_t col) const;
    };

    /// @brief Static utility class that computes a BrickGrid.
    class TilingBuilder
    {
    public:
        TilingBuilder() = delete;

        /// @brief Build the full tiling for config.brick_size_deg.
        /// @throws ConfigurationError if the brick size is not finite or not in (0, 180].
        [[nodiscard]] static BrickGrid build(const TilingConfig& config = {});

    private:
        /// @brief Values start + i × delta over the half-open range [start, stop),
        /// where delta is the realized first step (start + step) - start.
        [[nodiscard]] static std::vector<f64> arange(f64 start, f64 stop, f64 step);

        /// @brief Even RA column count for a non-polar row centered at dec_center.
        [[nodiscard]] static u32 column_count(f64 dec_center, f64 brick_size);
    };

} // namespace skybricks::tiling
