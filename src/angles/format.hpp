#pragma once

#include "angle.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace angles
{
// Renders the first representation present, in the order degrees, radians, gradians, DMS, using
// the unit's symbol: "13.2°", "0.25㎭", "40ᵍ", "90° 30′ 50″". Zero angles render as "0".
std::string toString(const Angle& angle);
} // namespace angles

template<>
struct fmt::formatter<angles::Angle> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const angles::Angle& angle, FormatContext& ctx) const
    {
        const std::string str = angles::toString(angle);
        return fmt::formatter<std::string_view>::format(std::string_view(str), ctx);
    }
};
