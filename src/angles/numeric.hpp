#pragma once

#include "result.hpp"

#include <cstdint>
#include <string_view>

namespace angles
{
// Converts the whole of `text` into a signed decimal integer.
Result<std::int32_t> parseInteger(std::string_view text);
Result<std::int64_t> parseWideInteger(std::string_view text);

// Converts the whole of `text` into a real number. The text must contain a decimal point, so
// "13.2" is accepted and "13" is not.
Result<double> parseFloat(std::string_view text);

// Converts `text` with parseFloat, falling back to integer text of any length.
Result<double> parseNumber(std::string_view text);
} // namespace angles
