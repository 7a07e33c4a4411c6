#include "dms.hpp"
#include "degrees.hpp"

#include <angles/angle_access.hpp>
#include <angles/math.hpp>
#include <angles/numeric.hpp>

#include <cmath>
#include <regex>

namespace angles::dms
{
using detail::AngleAccess;

namespace
{
// 2^63, the first magnitude that does not fit in std::int64_t.
constexpr double int64Bound = 9223372036854775808.0;

Dms splitDegrees(double realDegrees)
{
    if (!std::isfinite(realDegrees))
    {
        return Dms{.degrees = 0, .minutes = 0, .seconds = realDegrees};
    }
    if (std::fabs(realDegrees) >= int64Bound)
    {
        // Doubles this large are whole numbers, so only complete revolutions are lost.
        realDegrees = std::fmod(realDegrees, 360.0);
    }

    const auto   d = static_cast<std::int64_t>(std::trunc(realDegrees));
    const double realMinutes = fract(realDegrees) * 60.0;
    const auto   m = static_cast<std::int64_t>(std::trunc(realMinutes));
    const double s = (realMinutes - m) * 60.0;
    return Dms{.degrees = d, .minutes = m, .seconds = s};
}

Dms foldDms(Dms dms)
{
    // Same result as discarding one revolution at a time, without the iterations.
    if (dms.degrees > 360)
    {
        dms.degrees -= 360 * ((dms.degrees - 1) / 360);
    }
    else if (dms.degrees < -360)
    {
        dms.degrees += 360 * ((-1 - dms.degrees) / 360);
    }
    if (dms.degrees < 0)
    {
        // Only the final step into [0, 360) takes the complement.
        dms.degrees += 360;
        dms.minutes = 60 - dms.minutes;
        dms.seconds = 60.0 - dms.seconds;
    }
    return dms;
}
} // namespace

Angle init(const std::int64_t d) { return init(d, 0, 0.0); }

Angle init(const std::int64_t d, const std::int32_t m) { return init(d, m, 0.0); }

Angle init(const std::int64_t d, const std::int32_t m, const double s)
{
    return AngleAccess::withDms(AngleAccess::empty(), Dms{.degrees = d, .minutes = m, .seconds = s});
}

Result<Angle> parse(const std::string_view text)
{
    // Degree sign U+00B0, prime U+2032 and double prime U+2033, spelled out as UTF-8.
    static const std::regex pattern(
        "(-?[0-9]+)"
        "(?:\xC2\xB0|,| )? *"
        "([0-9]+)"
        "(?:\xE2\x80\xB2|'|,| )? *"
        "([0-9]+(?:\\.[0-9]+)?)"
        "(?:\xE2\x80\xB3|\")?");

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(text.begin(), text.end(), match, pattern))
    {
        const auto group = [&match](const std::size_t i) {
            return std::string_view(match[i].first, match[i].second);
        };

        const auto d = parseWideInteger(group(1));
        const auto m = parseInteger(group(2));
        const auto s = parseNumber(group(3));
        if (!d)
        {
            return Result<Angle>::failure(d.error());
        }
        if (!m)
        {
            return Result<Angle>::failure(m.error());
        }
        if (!s)
        {
            return Result<Angle>::failure(s.error());
        }
        return Result<Angle>::success(init(d.value(), m.value(), s.value()));
    }
    return Result<Angle>::failure(ErrorKind::Parse, "Unable to parse value as DMS");
}

Angle ensure(Angle angle)
{
    if (angle.dms())
    {
        return angle;
    }
    if (const auto& degrees = angle.degrees())
    {
        const Dms dms = splitDegrees(*degrees);
        return AngleAccess::withDms(std::move(angle), dms);
    }
    if (angle.radians() || angle.gradians())
    {
        return ensure(degrees::ensure(std::move(angle)));
    }
    return angle;
}

std::pair<Angle, Dms> toDms(Angle angle)
{
    angle = ensure(std::move(angle));
    const Dms dms = angle.dms().value();
    return {std::move(angle), dms};
}

Angle abs(const Angle& angle)
{
    const auto [_, dms] = toDms(angle);
    return AngleAccess::withDms(AngleAccess::empty(), foldDms(dms));
}
} // namespace angles::dms
