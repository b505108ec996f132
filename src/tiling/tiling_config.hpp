#pragma once

/// @file tiling_config.hpp
/// @brief Parameters of a brick tiling.

#include "core/types.hpp"

namespace skybricks::tiling
{
    /// @brief Default brick size used by survey pipelines (degrees).
    inline constexpr f64 kDefaultBrickSizeDeg = 0.25;

    /// @brief Configuration for tiling construction.
    /// Use designated initializers: BrickIndex index({.brick_size_deg = 0.5});
    struct TilingConfig
    {
        /// Brick edge length in degrees. Must be finite and in (0, 180].
        f64 brick_size_deg = kDefaultBrickSizeDeg;

        /// Report BRICKQ = 1 for the north polar row as well as the south one.
        /// Off by default: existing catalogs only override row 0.
        bool symmetric_polar_quadrant = false;
    };

    /// @brief Throws ConfigurationError if config cannot produce a valid grid.
    void validate(const TilingConfig& config);

} // namespace skybricks::tiling
