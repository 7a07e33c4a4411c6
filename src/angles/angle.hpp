#pragma once

#include <cstdint>
#include <optional>

namespace angles
{
// Degrees, minutes and seconds. The components are not required to be in canonical range, and
// negative angles carry their sign on the degrees component. Minutes are built from a
// std::int32_t and stored wider, so their complement 60 - m always fits.
struct Dms
{
    std::int64_t degrees = 0;
    std::int64_t minutes = 0;
    double       seconds = 0.0;

    bool operator==(const Dms& rhs) const noexcept = default;
};

namespace detail
{
struct AngleAccess;
}

// An angle which remembers every unit it has been converted to.
//
// A freshly constructed angle holds exactly one representation, the one it was created with (the
// zero angle is the exception and holds degrees, radians and gradians at once). The unit modules
// in units/ fill in the other representations on demand. A representation, once present, is
// never recomputed, so conversion functions return the angle along with the converted value and
// callers should keep using the returned angle.
class Angle
{
public:
    // The canonical zero angle, with degrees, radians and gradians all set to zero.
    static Angle zero();

    static Angle fromDegrees(double degrees);
    static Angle fromRadians(double radians);
    static Angle fromGradians(double gradians);
    static Angle fromDms(std::int64_t degrees, std::int32_t minutes = 0, double seconds = 0.0);

    const std::optional<double>& degrees() const noexcept { return mDegrees; }
    const std::optional<double>& radians() const noexcept { return mRadians; }
    const std::optional<double>& gradians() const noexcept { return mGradians; }
    const std::optional<Dms>&    dms() const noexcept { return mDms; }

    // True if any representation is exactly zero, or the DMS representation is (0, 0, 0).
    bool isZero() const noexcept;

    bool operator==(const Angle& rhs) const noexcept = default;

private:
    friend struct detail::AngleAccess;

    Angle() = default;

    std::optional<double> mDegrees;
    std::optional<double> mRadians;
    std::optional<double> mGradians;
    std::optional<Dms>    mDms;
};

// Folds the angle into its unit's principal range. The unit is picked from the first populated
// representation, in the order radians, degrees, gradians, DMS. Gradians have no range of their
// own and are folded as degrees.
Angle absoluteValue(const Angle& angle);
} // namespace angles
