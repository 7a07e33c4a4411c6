#include "angle.hpp"
#include "angle_access.hpp"
#include "assert.hpp"
#include "units/degrees.hpp"
#include "units/dms.hpp"
#include "units/gradians.hpp"
#include "units/radians.hpp"

#include <stdexcept>

namespace angles
{
Angle Angle::zero()
{
    using detail::AngleAccess;
    return AngleAccess::withGradians(
        AngleAccess::withRadians(AngleAccess::withDegrees(AngleAccess::empty(), 0.0), 0.0), 0.0);
}

Angle Angle::fromDegrees(const double degrees) { return angles::degrees::init(degrees); }
Angle Angle::fromRadians(const double radians) { return angles::radians::init(radians); }
Angle Angle::fromGradians(const double gradians) { return angles::gradians::init(gradians); }

Angle Angle::fromDms(const std::int64_t degrees, const std::int32_t minutes, const double seconds)
{
    return angles::dms::init(degrees, minutes, seconds);
}

bool Angle::isZero() const noexcept
{
    return (mDegrees && *mDegrees == 0.0) || (mRadians && *mRadians == 0.0) ||
           (mGradians && *mGradians == 0.0) || (mDms && *mDms == Dms{});
}

Angle absoluteValue(const Angle& angle)
{
    if (angle.radians())
    {
        return radians::abs(angle);
    }
    if (angle.degrees())
    {
        return degrees::abs(angle);
    }
    if (angle.gradians())
    {
        return degrees::abs(degrees::ensure(angle));
    }
    if (angle.dms())
    {
        return dms::abs(angle);
    }

    ANGLES_ASSERT(!"angle has no representation");
    throw std::logic_error("absoluteValue: angle has no representation");
}
} // namespace angles
