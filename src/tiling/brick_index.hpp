#pragma once

/// @file brick_index.hpp
/// @brief Read-only brick lookup over an immutable BrickGrid.

#include "core/types.hpp"
#include "tiling/brick_grid.hpp"
#include "tiling/brick_table.hpp"
#include "tiling/tiling_config.hpp"

#include <array>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace skybricks::tiling
{
    /// @brief Row and column of the brick containing a coordinate.
    struct BrickLocation
    {
        std::size_t row;
        std::size_t col;

        bool operator==(const BrickLocation&) const = default;
    };

    /// @brief Corners of a brick as (RA, Dec) in degrees, counter-clockwise from
    /// (ra_min, dec_min): (ra1,dec1), (ra2,dec1), (ra2,dec2), (ra1,dec2).
    using BrickVertices = std::array<Vec2d, 4>;

    /// @brief Query surface over one tiling.
    ///
    /// Every lookup comes in a single-coordinate form and a batch form taking
    /// parallel RA/Dec spans; batch results keep input order. RA is reduced
    /// modulo 360. Dec must lie in [-90, 90].
    ///
    /// Lookups are const and may run concurrently. The index owns a lazily
    /// built table and is therefore neither copyable nor movable; share it
    /// through std::shared_ptr<const BrickIndex>.
    class BrickIndex
    {
    public:
        /// @brief Build the grid for config.
        /// @throws ConfigurationError on an invalid brick size.
        explicit BrickIndex(const TilingConfig& config = {});

        /// @brief Adopt an already built grid.
        /// @throws ConfigurationError if the grid's brick size is invalid, it has
        /// fewer than two rows, or its rows do not tile the cell arena.
        explicit BrickIndex(BrickGrid grid);

        BrickIndex(const BrickIndex&) = delete;
        BrickIndex& operator=(const BrickIndex&) = delete;
        BrickIndex(BrickIndex&&) = delete;
        BrickIndex& operator=(BrickIndex&&) = delete;

        [[nodiscard]] f64 brick_size_deg() const { return m_grid.brick_size_deg(); }
        [[nodiscard]] std::size_t row_count() const { return m_grid.row_count(); }
        [[nodiscard]] std::size_t brick_count() const { return m_grid.brick_count(); }

        /// @brief Number of bricks in row.
        /// @throws std::out_of_range if row >= row_count(). Rows are grid
        /// indices, not coordinates, so this is not an OutOfRangeError.
        [[nodiscard]] std::size_t col_count(std::size_t row) const { return m_grid.rows.at(row).col_count; }

        [[nodiscard]] const BrickGrid& grid() const { return m_grid; }

        /// @brief "Bricks(bricksize=0.25)"
        [[nodiscard]] std::string to_string() const;

        // -----------------------------------------------------------------
        // Single coordinate (degrees)
        // -----------------------------------------------------------------

        /// @throws OutOfRangeError if dec is outside [-90, 90] or either value is not finite.
        [[nodiscard]] BrickLocation locate(f64 ra, f64 dec) const;

        [[nodiscard]] std::string name(f64 ra, f64 dec) const;
        [[nodiscard]] i32 id(f64 ra, f64 dec) const;
        [[nodiscard]] i16 quadrant(f64 ra, f64 dec) const;

        /// @brief Area of the containing brick in square degrees.
        [[nodiscard]] f64 area(f64 ra, f64 dec) const;

        [[nodiscard]] BrickVertices vertices(f64 ra, f64 dec) const;

        /// @brief Center (RA, Dec) of the containing brick, not the input coordinate.
        [[nodiscard]] Vec2d center(f64 ra, f64 dec) const;

        // -----------------------------------------------------------------
        // Batch (parallel spans of equal length)
        // @throws ShapeMismatchError if ras.size() != decs.size()
        // -----------------------------------------------------------------

        [[nodiscard]] std::vector<BrickLocation> locate(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<std::string> names(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<i32> ids(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<i16> quadrants(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<f64> areas(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<BrickVertices> vertices(std::span<const f64> ras, std::span<const f64> decs) const;
        [[nodiscard]] std::vector<Vec2d> centers(std::span<const f64> ras, std::span<const f64> decs) const;

        // -----------------------------------------------------------------
        // Table
        // -----------------------------------------------------------------

        /// @brief Every brick, row-major. Built on first call; later calls
        /// return the same object.
        [[nodiscard]] const BrickTable& to_table() const;

    private:
        [[nodiscard]] const BrickCell& cell(const BrickLocation& loc) const;

        /// @brief Reduce RA into [0, 360).
        [[nodiscard]] static f64 normalize_ra(f64 ra);

        BrickGrid m_grid;

        mutable std::once_flag m_table_once;
        mutable std::unique_ptr<const BrickTable> m_table;
    };

} // namespace skybricks::tiling
