#ifndef KAKU_POSITION_INCLUDED
#define KAKU_POSITION_INCLUDED

#include <algorithm>
#include <compare>
#include <cstddef>

namespace kaku
{
    struct [[nodiscard]] position_t final
    {
        size_t line{};
        size_t col{};

        [[nodiscard]] constexpr auto operator<=>(
            position_t const&) const = default;
    };

    // Half open, start <= end in document order.
    struct [[nodiscard]] range_t final
    {
        position_t start;
        position_t end;

        [[nodiscard]] constexpr bool empty() const { return start == end; }

        [[nodiscard]] constexpr bool contains(position_t const& p) const
        {
            return start <= p && p < end;
        }

        [[nodiscard]] constexpr auto operator<=>(range_t const&) const = default;
    };

    [[nodiscard]] constexpr range_t make_range(position_t const& a,
        position_t const& b)
    {
        return a <= b ? range_t{a, b} : range_t{b, a};
    }

    [[nodiscard]] constexpr bool overlaps(range_t const& lhs,
        range_t const& rhs)
    {
        return std::max(lhs.start, rhs.start) < std::min(lhs.end, rhs.end);
    }
} // namespace kaku

#endif
