#pragma once

#include "assert.hpp"

#include <string>
#include <utility>
#include <variant>

namespace angles
{
enum class ErrorKind
{
    // An inverse trigonometric function was called outside of its mathematical domain.
    Domain,
    // Text could not be converted into a number or an angle.
    Parse,
};

struct Error
{
    ErrorKind   kind;
    std::string message;

    bool operator==(const Error& rhs) const noexcept = default;
};

// Either a value of type T, or an Error describing why the value could not be produced.
template<typename T>
class [[nodiscard]] Result
{
public:
    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(ErrorKind kind, std::string message)
    {
        return Result(Error{.kind = kind, .message = std::move(message)});
    }
    static Result failure(Error error) { return Result(std::move(error)); }

    bool ok() const noexcept { return std::holds_alternative<T>(mData); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const&
    {
        ANGLES_ASSERT(ok());
        return std::get<T>(mData);
    }

    T&& value() &&
    {
        ANGLES_ASSERT(ok());
        return std::get<T>(std::move(mData));
    }

    const Error& error() const
    {
        ANGLES_ASSERT(!ok());
        return std::get<Error>(mData);
    }

private:
    explicit Result(T value)
        : mData(std::move(value))
    {
    }

    explicit Result(Error error)
        : mData(std::move(error))
    {
    }

    std::variant<T, Error> mData;
};
} // namespace angles
