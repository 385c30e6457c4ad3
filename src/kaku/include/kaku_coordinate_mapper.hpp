#ifndef KAKU_COORDINATE_MAPPER_INCLUDED
#define KAKU_COORDINATE_MAPPER_INCLUDED

#include <kaku_position.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace kaku
{
    class document_t;
} // namespace kaku

namespace kaku
{
    // Characters [start, end) of a line shown on one screen row.
    struct [[nodiscard]] segment_t final
    {
        size_t start{};
        size_t end{};

        [[nodiscard]] constexpr size_t size() const { return end - start; }

        [[nodiscard]] constexpr auto operator<=>(
            segment_t const&) const = default;
    };

    struct [[nodiscard]] visual_position_t final
    {
        size_t row{};
        size_t col{};

        [[nodiscard]] constexpr auto operator<=>(
            visual_position_t const&) const = default;
    };

    struct [[nodiscard]] view_placement_t final
    {
        size_t top_line{};
        size_t cursor_row{};

        [[nodiscard]] constexpr auto operator<=>(
            view_placement_t const&) const = default;
    };

    // Wrap width 0 disables wrapping. Always returns at least one segment.
    [[nodiscard]] std::vector<segment_t> wrapped_segments(
        std::u32string_view line,
        size_t wrap_width);

    // Lines above top_line are not counted, a position above it is placed
    // as if it was the top line.
    [[nodiscard]] visual_position_t logical_to_visual(
        document_t const& document,
        position_t const& position,
        size_t wrap_width,
        size_t top_line = 0);

    [[nodiscard]] position_t visual_to_logical(document_t const& document,
        size_t row,
        size_t col,
        size_t top_line,
        size_t wrap_width);

    // Screen rows taken by lines [first_line, last_line).
    [[nodiscard]] size_t visual_row_count(document_t const& document,
        size_t first_line,
        size_t last_line,
        size_t wrap_width);

    // Tabs advance to the next multiple of tab_width.
    [[nodiscard]] size_t visual_width(std::u32string_view text,
        size_t tab_width);

    [[nodiscard]] size_t visual_width_up_to(std::u32string_view text,
        size_t char_index,
        size_t tab_width);

    [[nodiscard]] size_t visual_col_to_char_index(std::u32string_view text,
        size_t visual_col,
        size_t tab_width);

    // Keeps the scroll position on resize unless the cursor would leave the
    // visible area.
    [[nodiscard]] view_placement_t adjust_view_for_resize(size_t prev_top_line,
        size_t cursor_line,
        size_t visible_lines,
        size_t total_lines);

    // Same mapping as the free functions, with wrapped segments cached per
    // line revision and wrap width.
    class [[nodiscard]] coordinate_mapper_t final
    {
    public:
        coordinate_mapper_t() = default;

        coordinate_mapper_t(coordinate_mapper_t const&) = default;

        coordinate_mapper_t(coordinate_mapper_t&&) noexcept = default;

    public:
        ~coordinate_mapper_t() = default;

    public:
        // The span refers into the cache and is valid until the next call on
        // this mapper.
        [[nodiscard]] std::span<segment_t const> segments(
            document_t const& document,
            size_t line,
            size_t wrap_width);

        [[nodiscard]] visual_position_t logical_to_visual(
            document_t const& document,
            position_t const& position,
            size_t wrap_width,
            size_t top_line = 0);

        [[nodiscard]] position_t visual_to_logical(document_t const& document,
            size_t row,
            size_t col,
            size_t top_line,
            size_t wrap_width);

        void clear();

        [[nodiscard]] size_t cached_lines() const;

    public:
        coordinate_mapper_t& operator=(coordinate_mapper_t const&) = default;

        coordinate_mapper_t& operator=(
            coordinate_mapper_t&&) noexcept = default;

    private:
        std::map<std::pair<uint64_t, size_t>, std::vector<segment_t>> cache_;
    };
} // namespace kaku

#endif
