#pragma once

#include <angles/angle.hpp>
#include <angles/result.hpp>

#include <string_view>
#include <utility>

namespace angles::radians
{
// An angle of `n` radians. Zero radians is the canonical zero angle.
Angle init(double n);

// Parses a leading, optionally signed decimal numeral such as "13", "0.25" or "13.2㎭".
Result<Angle> parse(std::string_view text);

// Adds a radian representation computed from degrees, gradians or DMS, whichever is found first.
// Radians are the representation used by the trigonometric functions.
Angle ensure(Angle angle);

// The angle, with its radian representation present, and the value in radians.
std::pair<Angle, double> toRadians(Angle angle);

// Discards complete revolutions and converts negatives, resulting in [0, 2π] radians.
Angle abs(const Angle& angle);
} // namespace angles::radians
