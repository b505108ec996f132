/// @file tiling_config.cpp
/// @brief Validation of tiling parameters.

#include "tiling/tiling_config.hpp"

#include "core/logger.hpp"
#include "tiling/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace skybricks::tiling
{

// -----------------------------------------------------------------
// A two-pole grid needs at least the two polar rows, so the brick
// size is bounded above by the full 180° declination range.
// -----------------------------------------------------------------

void validate(const TilingConfig& config)
{
    const f64 size = config.brick_size_deg;

    if (!std::isfinite(size) || size <= 0.0 || size > 2.0 * astro_constants::kPoleDecDeg)
    {
        SKB_CORE_ERROR("TilingConfig: rejected brick size {}", size);
        throw ConfigurationError(
            fmt::format("brick size must be a finite value in (0, 180] degrees, got {}", size));
    }
}

} // namespace skybricks::tiling
