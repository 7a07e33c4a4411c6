#pragma once

#include <angles/angle.hpp>
#include <angles/result.hpp>

#include <string_view>
#include <utility>

namespace angles::degrees
{
// An angle of `n` decimal degrees. Zero degrees is the canonical zero angle.
Angle init(double n);

// Parses a leading, optionally signed decimal numeral such as "13", "-13.2" or "13.2°".
Result<Angle> parse(std::string_view text);

// Adds a degree representation computed from radians, gradians or DMS, whichever is found first.
Angle ensure(Angle angle);

// The angle, with its degree representation present, and the value in degrees.
std::pair<Angle, double> toDegrees(Angle angle);

// Discards complete revolutions and converts negatives, resulting in [0, 360] degrees.
Angle abs(const Angle& angle);
} // namespace angles::degrees
