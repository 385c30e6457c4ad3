#ifndef CPPEXT_NUMERIC_INCLUDED
#define CPPEXT_NUMERIC_INCLUDED

#include <cassert>
#include <concepts>
#include <utility>

namespace cppext
{
    template<std::integral To, std::integral From>
    [[nodiscard]] constexpr To narrow(From const value)
    {
        assert(std::in_range<To>(value));
        return static_cast<To>(value);
    }

    template<std::unsigned_integral T>
    [[nodiscard]] constexpr T saturating_sub(T lhs, T rhs) noexcept;
} // namespace cppext

template<std::unsigned_integral T>
constexpr T cppext::saturating_sub(T const lhs, T const rhs) noexcept
{
    return lhs > rhs ? static_cast<T>(lhs - rhs) : T{};
}

#endif
