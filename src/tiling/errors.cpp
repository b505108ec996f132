/// @file errors.cpp
/// @brief Messages for the tiling exception types.

#include "tiling/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace skybricks
{

std::string_view to_string(CoordinateKind kind)
{
    switch (kind)
    {
    case CoordinateKind::RightAscension:
        return "RA";
    case CoordinateKind::Declination:
        return "Dec";
    }
    return "unknown";
}

OutOfRangeError::OutOfRangeError(CoordinateKind kind, f64 value)
    : BrickError(kind == CoordinateKind::Declination
                     ? fmt::format("Dec {} is outside [-90, 90] degrees", value)
                     : fmt::format("RA {} is not a finite angle", value))
    , m_kind{kind}
    , m_value{value}
{
}

ShapeMismatchError::ShapeMismatchError(std::size_t ra_count, std::size_t dec_count)
    : BrickError(fmt::format("RA and Dec sequences differ in length ({} vs {})", ra_count, dec_count))
{
}

} // namespace skybricks
