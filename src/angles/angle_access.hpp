#pragma once

#include "angle.hpp"

namespace angles::detail
{
// Construction and functional update of Angle, for use by the unit modules only.
struct AngleAccess
{
    static Angle empty() { return Angle(); }

    static Angle withDegrees(Angle angle, const double degrees)
    {
        angle.mDegrees = degrees;
        return angle;
    }

    static Angle withRadians(Angle angle, const double radians)
    {
        angle.mRadians = radians;
        return angle;
    }

    static Angle withGradians(Angle angle, const double gradians)
    {
        angle.mGradians = gradians;
        return angle;
    }

    static Angle withDms(Angle angle, const Dms dms)
    {
        angle.mDms = dms;
        return angle;
    }
};
} // namespace angles::detail
