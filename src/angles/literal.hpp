#pragma once

#include "angle.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace angles
{
class InvalidAngle : public std::runtime_error
{
public:
    explicit InvalidAngle(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// Builds an angle from text and a unit modifier: "d", "r", "g" or "dms". The text "0" is the zero
// angle whatever the modifier. Throws InvalidAngle when the text does not parse or the modifier is
// unknown.
Angle parseLiteral(std::string_view text, std::string_view modifier);

inline namespace literals
{
Angle operator""_deg(long double value);
Angle operator""_deg(unsigned long long value);
Angle operator""_rad(long double value);
Angle operator""_rad(unsigned long long value);
Angle operator""_grad(long double value);
Angle operator""_grad(unsigned long long value);
// "90 30 50"_dms
Angle operator""_dms(const char* text, std::size_t length);
} // namespace literals
} // namespace angles
