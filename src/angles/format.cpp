#include "format.hpp"

namespace angles
{
namespace
{
constexpr std::string_view degreeSign = "°";
constexpr std::string_view radianSign = "㎭";
constexpr std::string_view gradianSign = "ᵍ";
constexpr std::string_view prime = "′";
constexpr std::string_view doublePrime = "″";

std::string formatDms(const Dms& dms)
{
    if (dms.minutes == 0 && dms.seconds == 0.0)
    {
        return fmt::format("{}{}", dms.degrees, degreeSign);
    }
    if (dms.seconds == 0.0)
    {
        return fmt::format("{}{} {}{}", dms.degrees, degreeSign, dms.minutes, prime);
    }
    return fmt::format(
        "{}{} {}{} {}{}", dms.degrees, degreeSign, dms.minutes, prime, dms.seconds, doublePrime);
}
} // namespace

std::string toString(const Angle& angle)
{
    if (angle.isZero())
    {
        return "0";
    }
    if (const auto& d = angle.degrees())
    {
        return fmt::format("{}{}", *d, degreeSign);
    }
    if (const auto& r = angle.radians())
    {
        return fmt::format("{}{}", *r, radianSign);
    }
    if (const auto& g = angle.gradians())
    {
        return fmt::format("{}{}", *g, gradianSign);
    }
    if (const auto& dms = angle.dms())
    {
        return formatDms(*dms);
    }
    return "";
}
} // namespace angles
