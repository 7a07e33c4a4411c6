#include "trig.hpp"
#include "units/radians.hpp"

#include <cmath>

namespace angles::trig
{
namespace
{
template<typename Fn>
std::pair<Angle, double> applyToRadians(Angle angle, Fn&& fn)
{
    auto [withRadians, r] = radians::toRadians(std::move(angle));
    return {std::move(withRadians), fn(r)};
}

Result<Angle> wrapRadians(const double r) { return Result<Angle>::success(radians::init(r)); }

Result<Angle> domainError()
{
    return Result<Angle>::failure(ErrorKind::Domain, "Invalid function domain");
}
} // namespace

std::pair<Angle, double> cos(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::cos(r); });
}

std::pair<Angle, double> cosh(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::cosh(r); });
}

std::pair<Angle, double> sin(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::sin(r); });
}

std::pair<Angle, double> sinh(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::sinh(r); });
}

std::pair<Angle, double> tan(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::tan(r); });
}

std::pair<Angle, double> tanh(Angle angle)
{
    return applyToRadians(std::move(angle), [](const double r) { return std::tanh(r); });
}

Result<Angle> acos(const double x)
{
    if (!(x >= -1.0 && x <= 1.0))
    {
        return domainError();
    }
    return wrapRadians(std::acos(x));
}

Result<Angle> acosh(const double x)
{
    if (!(x >= 1.0))
    {
        return domainError();
    }
    return wrapRadians(std::acosh(x));
}

Result<Angle> asin(const double x)
{
    if (!(x >= -1.0 && x <= 1.0))
    {
        return domainError();
    }
    return wrapRadians(std::asin(x));
}

Result<Angle> asinh(const double x)
{
    if (std::isnan(x))
    {
        return domainError();
    }
    return wrapRadians(std::asinh(x));
}

Result<Angle> atan(const double x)
{
    if (std::isnan(x))
    {
        return domainError();
    }
    return wrapRadians(std::atan(x));
}

Result<Angle> atan2(const double y, const double x)
{
    if (std::isnan(y) || std::isnan(x))
    {
        return domainError();
    }
    return wrapRadians(std::atan2(y, x));
}
} // namespace angles::trig
