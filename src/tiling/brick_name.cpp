/// @file brick_name.cpp
/// @brief Brick name encoding.

#include "tiling/brick_name.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace skybricks::tiling
{

namespace
{

constexpr f64 kNameScale = 10000.0;
constexpr std::size_t kRaDigits = 4;
constexpr std::size_t kDecDigits = 3;

} // anonymous namespace

std::string encode_brick_name(f64 ra_center_deg, f64 dec_center_deg)
{
    const std::string ra = fmt::format("{:07.0f}", ra_center_deg * kNameScale);
    const std::string dec = fmt::format("{:06.0f}", std::abs(dec_center_deg) * kNameScale);

    std::string name;
    name.reserve(kBrickNameLength);
    name.append(ra, 0, kRaDigits);
    name.push_back(dec_center_deg >= 0.0 ? 'p' : 'm');
    name.append(dec, 0, kDecDigits);
    return name;
}

} // namespace skybricks::tiling
