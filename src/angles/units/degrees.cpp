#include "degrees.hpp"

#include <angles/angle_access.hpp>
#include <angles/math.hpp>
#include <angles/numeric.hpp>

#include <numbers>
#include <regex>
#include <string>

namespace angles::degrees
{
using detail::AngleAccess;

Angle init(const double n)
{
    if (n == 0.0)
    {
        return Angle::zero();
    }
    return AngleAccess::withDegrees(AngleAccess::empty(), n);
}

Result<Angle> parse(const std::string_view text)
{
    static const std::regex numeral(R"(^-?[0-9]+(?:\.[0-9]+)?)");

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(text.begin(), text.end(), match, numeral))
    {
        if (const auto n = parseNumber(std::string_view(match[0].first, match[0].second)))
        {
            return Result<Angle>::success(init(n.value()));
        }
    }
    return Result<Angle>::failure(ErrorKind::Parse, "Unable to parse value as degrees");
}

Angle ensure(Angle angle)
{
    if (angle.degrees())
    {
        return angle;
    }
    if (const auto& radians = angle.radians())
    {
        const double degrees = *radians * 180.0 / std::numbers::pi;
        return AngleAccess::withDegrees(std::move(angle), degrees);
    }
    if (const auto& gradians = angle.gradians())
    {
        const double degrees = *gradians / 400.0 * 360.0;
        return AngleAccess::withDegrees(std::move(angle), degrees);
    }
    if (const auto& dms = angle.dms())
    {
        const double degrees = dms->degrees + dms->minutes / 60.0 + dms->seconds / 3600.0;
        return AngleAccess::withDegrees(std::move(angle), degrees);
    }
    return angle;
}

std::pair<Angle, double> toDegrees(Angle angle)
{
    angle = ensure(std::move(angle));
    const double degrees = angle.degrees().value();
    return {std::move(angle), degrees};
}

Angle abs(const Angle& angle)
{
    const auto [_, degrees] = toDegrees(angle);
    return init(foldRevolutions(degrees, 360.0));
}
} // namespace angles::degrees
