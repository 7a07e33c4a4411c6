#include "gradians.hpp"
#include "degrees.hpp"

#include <angles/angle_access.hpp>
#include <angles/numeric.hpp>

#include <numbers>
#include <regex>

namespace angles::gradians
{
using detail::AngleAccess;

Angle init(const double n)
{
    if (n == 0.0)
    {
        return Angle::zero();
    }
    return AngleAccess::withGradians(AngleAccess::empty(), n);
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
    return Result<Angle>::failure(ErrorKind::Parse, "Unable to parse value as gradians");
}

Angle ensure(Angle angle)
{
    if (angle.gradians())
    {
        return angle;
    }
    if (const auto& radians = angle.radians())
    {
        const double gradians = *radians * 200.0 / std::numbers::pi;
        return AngleAccess::withGradians(std::move(angle), gradians);
    }
    if (const auto& degrees = angle.degrees())
    {
        const double gradians = *degrees / 360.0 * 400.0;
        return AngleAccess::withGradians(std::move(angle), gradians);
    }
    if (angle.dms())
    {
        return ensure(degrees::ensure(std::move(angle)));
    }
    return angle;
}

std::pair<Angle, double> toGradians(Angle angle)
{
    angle = ensure(std::move(angle));
    const double gradians = angle.gradians().value();
    return {std::move(angle), gradians};
}
} // namespace angles::gradians
