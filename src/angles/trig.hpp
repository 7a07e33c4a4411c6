#pragma once

#include "angle.hpp"
#include "result.hpp"

#include <utility>

// Trigonometric functions taking and returning Angle.
//
// The forward functions convert their argument to radians if needed and return the angle, which
// now holds radians, along with the result. The inverse functions check the domain of their
// argument and fail with ErrorKind::Domain instead of producing NaN.
//
// The results come from the C library's implementations, which may differ in the last few bits
// between platforms.
namespace angles::trig
{
std::pair<Angle, double> cos(Angle angle);
std::pair<Angle, double> cosh(Angle angle);
std::pair<Angle, double> sin(Angle angle);
std::pair<Angle, double> sinh(Angle angle);
std::pair<Angle, double> tan(Angle angle);
std::pair<Angle, double> tanh(Angle angle);

// x in [-1, 1]
Result<Angle> acos(double x);
// x in [1, +inf)
Result<Angle> acosh(double x);
// x in [-1, 1]
Result<Angle> asin(double x);
Result<Angle> asinh(double x);
Result<Angle> atan(double x);
// The angle between the positive x axis and the point (x, y).
Result<Angle> atan2(double y, double x);
} // namespace angles::trig
