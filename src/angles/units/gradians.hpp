#pragma once

#include <angles/angle.hpp>
#include <angles/result.hpp>

#include <string_view>
#include <utility>

namespace angles::gradians
{
// An angle of `n` gradians. Zero gradians is the canonical zero angle.
Angle init(double n);

// Parses a leading, optionally signed decimal numeral such as "40" or "13.2ᵍ".
Result<Angle> parse(std::string_view text);

// Adds a gradian representation computed from radians or degrees. An angle holding only DMS gains
// a degree representation on the way.
Angle ensure(Angle angle);

// The angle, with its gradian representation present, and the value in gradians.
std::pair<Angle, double> toGradians(Angle angle);

// There is no gradian abs(): absoluteValue() folds gradian-only angles as degrees.
} // namespace angles::gradians
