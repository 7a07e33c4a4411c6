#include "literal.hpp"
#include "units/degrees.hpp"
#include "units/dms.hpp"
#include "units/gradians.hpp"
#include "units/radians.hpp"

#include <utility>

namespace angles
{
namespace
{
Angle unwrap(Result<Angle> result)
{
    if (!result)
    {
        throw InvalidAngle(result.error().message);
    }
    return std::move(result).value();
}
} // namespace

Angle parseLiteral(const std::string_view text, const std::string_view modifier)
{
    if (text == "0")
    {
        return Angle::zero();
    }
    if (modifier == "d")
    {
        return unwrap(degrees::parse(text));
    }
    if (modifier == "r")
    {
        return unwrap(radians::parse(text));
    }
    if (modifier == "g")
    {
        return unwrap(gradians::parse(text));
    }
    if (modifier == "dms")
    {
        return unwrap(dms::parse(text));
    }
    throw InvalidAngle("Unable to parse angle");
}

inline namespace literals
{
Angle operator""_deg(const long double value)
{
    return degrees::init(static_cast<double>(value));
}

Angle operator""_deg(const unsigned long long value)
{
    return degrees::init(static_cast<double>(value));
}

Angle operator""_rad(const long double value)
{
    return radians::init(static_cast<double>(value));
}

Angle operator""_rad(const unsigned long long value)
{
    return radians::init(static_cast<double>(value));
}

Angle operator""_grad(const long double value)
{
    return gradians::init(static_cast<double>(value));
}

Angle operator""_grad(const unsigned long long value)
{
    return gradians::init(static_cast<double>(value));
}

Angle operator""_dms(const char* text, const std::size_t length)
{
    return unwrap(dms::parse(std::string_view(text, length)));
}
} // namespace literals
} // namespace angles
