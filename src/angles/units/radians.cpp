#include "radians.hpp"

#include <angles/angle_access.hpp>
#include <angles/math.hpp>
#include <angles/numeric.hpp>

#include <numbers>
#include <regex>

namespace angles::radians
{
using detail::AngleAccess;

namespace
{
constexpr double revolution = 2.0 * std::numbers::pi;

double degreesToRadians(const double degrees) { return degrees / 180.0 * std::numbers::pi; }
} // namespace

Angle init(const double n)
{
    if (n == 0.0)
    {
        return Angle::zero();
    }
    return AngleAccess::withRadians(AngleAccess::empty(), n);
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
    return Result<Angle>::failure(ErrorKind::Parse, "Unable to parse value as radians");
}

Angle ensure(Angle angle)
{
    if (angle.radians())
    {
        return angle;
    }
    if (const auto& degrees = angle.degrees())
    {
        const double radians = degreesToRadians(*degrees);
        return AngleAccess::withRadians(std::move(angle), radians);
    }
    if (const auto& gradians = angle.gradians())
    {
        const double radians = *gradians * std::numbers::pi / 200.0;
        return AngleAccess::withRadians(std::move(angle), radians);
    }
    if (const auto& dms = angle.dms())
    {
        // The intermediate degrees are not kept.
        const double degrees = dms->degrees + dms->minutes / 60.0 + dms->seconds / 3600.0;
        const double radians = degreesToRadians(degrees);
        return AngleAccess::withRadians(std::move(angle), radians);
    }
    return angle;
}

std::pair<Angle, double> toRadians(Angle angle)
{
    angle = ensure(std::move(angle));
    const double radians = angle.radians().value();
    return {std::move(angle), radians};
}

Angle abs(const Angle& angle)
{
    const auto [_, radians] = toRadians(angle);
    return init(foldRevolutions(radians, revolution));
}
} // namespace angles::radians
