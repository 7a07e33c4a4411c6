#pragma once

#include <cmath>

namespace angles
{
// The fractional part of x, keeping the sign of x.
inline double fract(const double x)
{
    if (x >= 0.0)
    {
        return x - std::floor(x);
    }
    else
    {
        return x - std::ceil(x);
    }
}

// Folds `value` into [0, modulus] by adding or subtracting whole revolutions one at a time.
// Values too large for a single subtraction to make progress fall back to std::fmod. Non-finite
// values are returned as is.
inline double foldRevolutions(double value, const double modulus)
{
    if (!std::isfinite(value))
    {
        return value;
    }

    constexpr double maxSteps = 65536.0;
    if (std::fabs(value) > maxSteps * modulus)
    {
        value = std::fmod(value, modulus);
    }

    while (value > modulus)
    {
        value -= modulus;
    }
    while (value < 0.0)
    {
        value += modulus;
    }
    return value;
}
} // namespace angles
