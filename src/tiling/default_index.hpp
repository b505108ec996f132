#pragma once

/// @file default_index.hpp
/// @brief Process-wide cached BrickIndex and the brickname() convenience.

#include "core/types.hpp"
#include "tiling/brick_index.hpp"
#include "tiling/tiling_config.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace skybricks::tiling
{
    /// @brief Shared index for brick_size_deg, built on first use.
    ///
    /// The cache keeps one snapshot. Asking for another size builds a new
    /// index and replaces the snapshot; callers still holding the old
    /// pointer keep a valid index. Safe to call from several threads.
    ///
    /// @throws ConfigurationError on an invalid brick size.
    [[nodiscard]] std::shared_ptr<const BrickIndex> default_index(f64 brick_size_deg = kDefaultBrickSizeDeg);

    /// @brief Name of the brick covering (ra, dec), using default_index(brick_size_deg).
    [[nodiscard]] std::string brickname(f64 ra, f64 dec, f64 brick_size_deg = kDefaultBrickSizeDeg);

    /// @brief Batch form of brickname().
    [[nodiscard]] std::vector<std::string> bricknames(std::span<const f64> ras,
                                                      std::span<const f64> decs,
                                                      f64 brick_size_deg = kDefaultBrickSizeDeg);

} // namespace skybricks::tiling
