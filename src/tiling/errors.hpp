#pragma once

/// @file errors.hpp
/// @brief Exceptions raised by tiling construction and brick lookup.

#include "core/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace skybricks
{
    /// @brief Base class of every error thrown by the library.
    class BrickError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A tiling parameter cannot produce a valid grid.
    class ConfigurationError : public BrickError
    {
    public:
        using BrickError::BrickError;
    };

    /// @brief Which coordinate of a lookup was rejected.
    enum class CoordinateKind
    {
        RightAscension,
        Declination,
    };

    [[nodiscard]] std::string_view to_string(CoordinateKind kind);

    /// @brief A coordinate lies outside the domain a brick lookup accepts.
    class OutOfRangeError : public BrickError
    {
    public:
        OutOfRangeError(CoordinateKind kind, f64 value);

        [[nodiscard]] CoordinateKind kind() const noexcept { return m_kind; }
        [[nodiscard]] f64 value() const noexcept { return m_value; }

    private:
        CoordinateKind m_kind;
        f64 m_value;
    };

    /// @brief Batch RA and Dec sequences have different lengths.
    class ShapeMismatchError : public BrickError
    {
    public:
        ShapeMismatchError(std::size_t ra_count, std::size_t dec_count);
    };

} // namespace skybricks
