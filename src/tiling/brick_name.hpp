#pragma once

/// @file brick_name.hpp
/// @brief Deterministic 8-character brick names.

#include "core/types.hpp"

#include <cstddef>
#include <string>

namespace skybricks::tiling
{
    /// @brief Length of every brick name.
    inline constexpr std::size_t kBrickNameLength = 8;

    /// @brief Encode a brick name from its center.
    ///
    /// Format is RRRR[p|m]DDD: the leading 4 digits of round(ra×10000)
    /// zero-padded to 7, 'p' for dec >= 0 or 'm' otherwise, then the leading
    /// 3 digits of round(|dec|×10000) zero-padded to 6. Rounding acts on the
    /// exact binary value, so 39.599999999999994 encodes as 0396.
    ///
    /// @param ra_center_deg Brick center right ascension, [0, 360].
    /// @param dec_center_deg Brick center declination, [-90, 90].
    [[nodiscard]] std::string encode_brick_name(f64 ra_center_deg, f64 dec_center_deg);

} // namespace skybricks::tiling
