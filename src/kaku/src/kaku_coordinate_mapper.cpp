#include <kaku_coordinate_mapper.hpp>

#include <kaku_document.hpp>

#include <cppext_numeric.hpp>

#include <algorithm>

namespace
{
    // Entries for lines that no longer exist are never hit again, dropping
    // the whole cache keeps it bounded.
    constexpr size_t max_cached_lines{16384};

    [[nodiscard]] size_t segment_index(
        std::span<kaku::segment_t const> const segments,
        size_t const col)
    {
        for (size_t i{1}; i != segments.size(); ++i)
        {
            if (col < segments[i].start)
            {
                return i - 1;
            }
        }
        return segments.size() - 1;
    }

    template<typename SegmentsFn>
    [[nodiscard]] kaku::visual_position_t to_visual(
        kaku::document_t const& document,
        kaku::position_t const& position,
        size_t const top_line,
        SegmentsFn&& segments_of)
    {
        kaku::position_t const pos{document.clamp(position)};

        size_t row{};
        for (size_t line{std::min(top_line, pos.line)}; line != pos.line;
            ++line)
        {
            row += std::span<kaku::segment_t const>{segments_of(line)}.size();
        }

        auto const& line_segments{segments_of(pos.line)};
        std::span<kaku::segment_t const> const segments{line_segments};
        size_t const index{segment_index(segments, pos.col)};

        return {row + index, pos.col - segments[index].start};
    }

    template<typename SegmentsFn>
    [[nodiscard]] kaku::position_t to_logical(kaku::document_t const& document,
        size_t row,
        size_t const col,
        size_t const top_line,
        SegmentsFn&& segments_of)
    {
        size_t const last_line{document.line_count() - 1};

        size_t line{std::min(top_line, last_line)};
        for (;;)
        {
            auto const& line_segments{segments_of(line)};
            std::span<kaku::segment_t const> const segments{line_segments};
            if (row < segments.size() || line == last_line)
            {
                size_t const index{std::min(row, segments.size() - 1)};
                kaku::segment_t const& segment{segments[index]};

                size_t const wanted{segment.start + col};
                if (index + 1 == segments.size())
                {
                    return {line, std::min(wanted, segment.end)};
                }
                return {line, std::min(wanted, segment.end - 1)};
            }

            row -= segments.size();
            ++line;
        }
    }

    [[nodiscard]] size_t advance(size_t const width,
        char32_t const c,
        size_t const tab_width)
    {
        if (c == U'\t' && tab_width != 0)
        {
            return width + (tab_width - width % tab_width);
        }
        return width + 1;
    }
} // namespace

std::vector<kaku::segment_t> kaku::wrapped_segments(
    std::u32string_view const line,
    size_t const wrap_width)
{
    if (wrap_width == 0 || line.size() <= wrap_width)
    {
        return {{0, line.size()}};
    }

    std::vector<segment_t> rv;
    rv.reserve(line.size() / wrap_width + 1);
    for (size_t start{}; start < line.size(); start += wrap_width)
    {
        rv.push_back({start, std::min(start + wrap_width, line.size())});
    }
    return rv;
}

kaku::visual_position_t kaku::logical_to_visual(document_t const& document,
    position_t const& position,
    size_t const wrap_width,
    size_t const top_line)
{
    return to_visual(document,
        position,
        top_line,
        [&document, wrap_width](size_t const line)
        { return wrapped_segments(document[line], wrap_width); });
}

kaku::position_t kaku::visual_to_logical(document_t const& document,
    size_t const row,
    size_t const col,
    size_t const top_line,
    size_t const wrap_width)
{
    return to_logical(document,
        row,
        col,
        top_line,
        [&document, wrap_width](size_t const line)
        { return wrapped_segments(document[line], wrap_width); });
}

size_t kaku::visual_row_count(document_t const& document,
    size_t const first_line,
    size_t const last_line,
    size_t const wrap_width)
{
    size_t rv{};
    for (size_t line{first_line};
        line < std::min(last_line, document.line_count());
        ++line)
    {
        rv += wrapped_segments(document[line], wrap_width).size();
    }
    return rv;
}

size_t kaku::visual_width(std::u32string_view const text,
    size_t const tab_width)
{
    size_t rv{};
    for (char32_t const c : text)
    {
        rv = advance(rv, c, tab_width);
    }
    return rv;
}

size_t kaku::visual_width_up_to(std::u32string_view const text,
    size_t const char_index,
    size_t const tab_width)
{
    return visual_width(text.substr(0, std::min(char_index, text.size())),
        tab_width);
}

size_t kaku::visual_col_to_char_index(std::u32string_view const text,
    size_t const visual_col,
    size_t const tab_width)
{
    size_t width{};
    for (size_t i{}; i != text.size(); ++i)
    {
        if (width >= visual_col)
        {
            return i;
        }
        width = advance(width, text[i], tab_width);
    }
    return text.size();
}

kaku::view_placement_t kaku::adjust_view_for_resize(
    size_t const prev_top_line,
    size_t const cursor_line,
    size_t const visible_lines,
    size_t const total_lines)
{
    if (total_lines == 0)
    {
        return {};
    }

    size_t const visible{std::max(visible_lines, size_t{1})};
    size_t const max_top{total_lines - 1};

    size_t top{std::min(prev_top_line, max_top)};
    if (cursor_line < top)
    {
        top = cursor_line;
    }
    if (cursor_line >= top + visible)
    {
        top = cppext::saturating_sub(cursor_line, visible - 1);
    }
    top = std::min(top, max_top);

    return {top, cppext::saturating_sub(cursor_line, top)};
}

std::span<kaku::segment_t const> kaku::coordinate_mapper_t::segments(
    document_t const& document,
    size_t const line,
    size_t const wrap_width)
{
    std::pair<uint64_t, size_t> const key{document.line_revision(line),
        wrap_width};

    if (auto const it{cache_.find(key)}; it != cache_.cend())
    {
        return it->second;
    }

    if (cache_.size() >= max_cached_lines)
    {
        cache_.clear();
    }

    return cache_.emplace(key, wrapped_segments(document[line], wrap_width))
        .first->second;
}

kaku::visual_position_t kaku::coordinate_mapper_t::logical_to_visual(
    document_t const& document,
    position_t const& position,
    size_t const wrap_width,
    size_t const top_line)
{
    return to_visual(document,
        position,
        top_line,
        [this, &document, wrap_width](size_t const line)
        { return segments(document, line, wrap_width); });
}

kaku::position_t kaku::coordinate_mapper_t::visual_to_logical(
    document_t const& document,
    size_t const row,
    size_t const col,
    size_t const top_line,
    size_t const wrap_width)
{
    return to_logical(document,
        row,
        col,
        top_line,
        [this, &document, wrap_width](size_t const line)
        { return segments(document, line, wrap_width); });
}

void kaku::coordinate_mapper_t::clear() { cache_.clear(); }

size_t kaku::coordinate_mapper_t::cached_lines() const
{
    return cache_.size();
}
