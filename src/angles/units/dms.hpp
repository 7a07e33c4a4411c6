#pragma once

#include <angles/angle.hpp>
#include <angles/result.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

namespace angles::dms
{
// An angle of `d` degrees, `m` minutes and `s` seconds. Omitted components are zero. Unlike the
// other units, an all-zero DMS angle is kept as DMS rather than becoming the zero angle.
Angle init(std::int64_t d);
Angle init(std::int64_t d, std::int32_t m);
Angle init(std::int64_t d, std::int32_t m, double s);

// Parses three numerals separated by degree, prime, comma or space characters, e.g.
// "166 45 58.46", "166,45,58.46" or "-166° 45′ 58.46″".
Result<Angle> parse(std::string_view text);

// Adds a DMS representation. Decimal degrees are split by truncation toward zero; any other unit
// is first converted to degrees, which are kept. Degrees beyond the std::int64_t range are
// reduced by whole revolutions first, and non-finite degrees end up in the seconds.
Angle ensure(Angle angle);

// The angle, with its DMS representation present, and that representation.
std::pair<Angle, Dms> toDms(Angle angle);

// Discards complete revolutions of the degrees component. When the degrees component has to be
// brought up from the last negative revolution, minutes and seconds are replaced by their
// complements 60 - m and 60 - s.
Angle abs(const Angle& angle);
} // namespace angles::dms
