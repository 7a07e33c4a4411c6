#include "numeric.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace angles
{
namespace
{
template<typename Int>
Result<Int> parseWhole(const std::string_view text)
{
    Int         value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last)
    {
        return Result<Int>::failure(ErrorKind::Parse, "Unable to convert value to integer");
    }
    return Result<Int>::success(value);
}

// An optional minus sign followed by at least one digit.
bool isIntegerText(std::string_view text)
{
    if (!text.empty() && text.front() == '-')
    {
        text.remove_prefix(1);
    }
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](const char c) { return c >= '0' && c <= '9'; });
}
} // namespace

Result<std::int32_t> parseInteger(const std::string_view text)
{
    return parseWhole<std::int32_t>(text);
}

Result<std::int64_t> parseWideInteger(const std::string_view text)
{
    return parseWhole<std::int64_t>(text);
}

Result<double> parseFloat(const std::string_view text)
{
    const auto fail = []() {
        return Result<double>::failure(ErrorKind::Parse, "Unable to convert value to float");
    };

    const auto point = text.find('.');
    if (point == std::string_view::npos || point == 0 || point + 1 == text.size())
    {
        return fail();
    }

    double      value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
    if (ec != std::errc() || ptr != last)
    {
        return fail();
    }
    return Result<double>::success(value);
}

Result<double> parseNumber(const std::string_view text)
{
    if (auto real = parseFloat(text))
    {
        return real;
    }
    if (isIntegerText(text))
    {
        double      value = 0.0;
        const char* last = text.data() + text.size();

        const auto [ptr, ec] =
            std::from_chars(text.data(), last, value, std::chars_format::fixed);
        if (ec == std::errc() && ptr == last)
        {
            return Result<double>::success(value);
        }
    }
    return Result<double>::failure(ErrorKind::Parse, "Unable to convert value to number");
}
} // namespace angles
