#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace skybricks
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i16 = int16_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Sky positions are (RA, Dec) pairs in degrees
    using Vec2d = glm::dvec2;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi             = glm::pi<f64>();
        constexpr f64 kTwoPi          = 2.0 * kPi;
        constexpr f64 kDegToRad       = kPi / 180.0;
        constexpr f64 kRadToDeg       = 180.0 / kPi;
        constexpr f64 kFullCircleDeg  = 360.0;
        constexpr f64 kPoleDecDeg     = 90.0;

        /// Area of the whole sphere in square degrees (4π sr).
        constexpr f64 kSphereAreaDeg2 = 4.0 * kPi * kRadToDeg * kRadToDeg;
    }
}
