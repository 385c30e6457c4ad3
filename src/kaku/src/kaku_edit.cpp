#include <kaku_edit.hpp>

#include <kaku_document.hpp>
#include <kaku_error.hpp>

#include <cppext_overloaded.hpp>

#include <string>

namespace
{
    [[nodiscard]] std::expected<void, std::error_code> check_char(
        kaku::document_t const& document,
        kaku::position_t const& position,
        char32_t const wanted)
    {
        std::expected<char32_t, std::error_code> const actual{
            document.char_at(position)};
        if (!actual)
        {
            return std::unexpected{actual.error()};
        }

        if (*actual != wanted)
        {
            return std::unexpected{
                make_error_code(kaku::error_t::history_mismatch)};
        }

        return {};
    }

    [[nodiscard]] kaku::position_t after_insert(kaku::position_t const& p,
        kaku::position_t const& at,
        kaku::position_t const& end)
    {
        if (p < at)
        {
            return p;
        }

        if (p.line == at.line)
        {
            return {end.line, end.col + (p.col - at.col)};
        }

        return {p.line + (end.line - at.line), p.col};
    }

    [[nodiscard]] kaku::position_t after_erase(kaku::position_t const& p,
        kaku::range_t const& range)
    {
        if (p <= range.start)
        {
            return p;
        }

        if (p < range.end)
        {
            return range.start;
        }

        if (p.line == range.end.line)
        {
            return {range.start.line,
                range.start.col + (p.col - range.end.col)};
        }

        return {p.line - (range.end.line - range.start.line), p.col};
    }

    [[nodiscard]] std::expected<void, std::error_code> erase_range(
        kaku::document_t& document,
        kaku::range_t const& range)
    {
        return document.erase(range).transform([](auto&&) { });
    }

    [[nodiscard]] std::expected<void, std::error_code> insert_text(
        kaku::document_t& document,
        kaku::position_t const& position,
        std::u32string_view const text)
    {
        return document.insert(position, text).transform([](auto&&) { });
    }
} // namespace

kaku::edit_t kaku::invert(edit_t const& edit)
{
    return std::visit(
        cppext::overloaded{
            [](insert_char_t const& e) -> edit_t
            { return delete_char_after_t{e.position, e.character}; },
            [](delete_char_before_t const& e) -> edit_t
            {
                return insert_char_t{{e.position.line, e.position.col - 1},
                    e.character};
            },
            [](delete_char_after_t const& e) -> edit_t
            { return insert_char_t{e.position, e.character}; },
            [](split_line_t const& e) -> edit_t
            { return join_line_t{e.position}; },
            [](join_line_t const& e) -> edit_t
            { return split_line_t{e.position}; },
            [](insert_text_block_t const& e) -> edit_t
            {
                return delete_range_t{{e.position, end_of(e.position, e.text)},
                    e.text};
            },
            [](delete_range_t const& e) -> edit_t
            { return insert_text_block_t{e.range.start, e.text}; }},
        edit);
}

std::expected<void, std::error_code> kaku::apply(document_t& document,
    edit_t const& edit)
{
    return std::visit(
        cppext::overloaded{
            [&document](insert_char_t const& e)
            {
                return insert_text(document,
                    e.position,
                    std::u32string_view{&e.character, 1});
            },
            [&document](delete_char_before_t const& e)
                -> std::expected<void, std::error_code>
            {
                if (e.position.col == 0)
                {
                    return std::unexpected{
                        make_error_code(error_t::out_of_bounds)};
                }

                position_t const start{e.position.line, e.position.col - 1};
                return check_char(document, start, e.character)
                    .and_then([&]()
                        { return erase_range(document, {start, e.position}); });
            },
            [&document](delete_char_after_t const& e)
            {
                position_t const end{e.position.line, e.position.col + 1};
                return check_char(document, e.position, e.character)
                    .and_then([&]()
                        { return erase_range(document, {e.position, end}); });
            },
            [&document](split_line_t const& e)
            { return insert_text(document, e.position, U"\n"); },
            [&document](join_line_t const& e)
                -> std::expected<void, std::error_code>
            {
                if (e.position.line + 1 >= document.line_count() ||
                    e.position.col != document.line_length(e.position.line))
                {
                    return std::unexpected{
                        make_error_code(error_t::history_mismatch)};
                }

                return erase_range(document,
                    {e.position, {e.position.line + 1, 0}});
            },
            [&document](insert_text_block_t const& e)
            { return insert_text(document, e.position, e.text); },
            [&document](delete_range_t const& e)
                -> std::expected<void, std::error_code>
            {
                std::expected<std::u32string, std::error_code> const current{
                    document.text(e.range)};
                if (!current)
                {
                    return std::unexpected{current.error()};
                }

                if (*current != e.text)
                {
                    return std::unexpected{
                        make_error_code(error_t::history_mismatch)};
                }

                return erase_range(document, e.range);
            }},
        edit);
}

kaku::position_t kaku::transform(position_t const& position,
    edit_t const& edit)
{
    return std::visit(
        cppext::overloaded{
            [&position](insert_char_t const& e)
            {
                return after_insert(position,
                    e.position,
                    {e.position.line, e.position.col + 1});
            },
            [&position](delete_char_before_t const& e)
            {
                return after_erase(position,
                    {{e.position.line, e.position.col - 1}, e.position});
            },
            [&position](delete_char_after_t const& e)
            {
                return after_erase(position,
                    {e.position, {e.position.line, e.position.col + 1}});
            },
            [&position](split_line_t const& e)
            {
                return after_insert(position,
                    e.position,
                    {e.position.line + 1, 0});
            },
            [&position](join_line_t const& e)
            {
                return after_erase(position,
                    {e.position, {e.position.line + 1, 0}});
            },
            [&position](insert_text_block_t const& e)
            {
                return after_insert(position,
                    e.position,
                    end_of(e.position, e.text));
            },
            [&position](delete_range_t const& e)
            { return after_erase(position, e.range); }},
        edit);
}

kaku::position_t kaku::end_of(position_t const& start,
    std::u32string_view const text)
{
    size_t const last_break{text.rfind(U'\n')};
    if (last_break == std::u32string_view::npos)
    {
        return {start.line, start.col + text.size()};
    }

    return {start.line + count_lines(text) - 1, text.size() - last_break - 1};
}

size_t kaku::content_size(history_entry_t const& entry)
{
    size_t rv{sizeof(history_entry_t) +
        (entry.before.others.size() + entry.after.others.size()) *
            sizeof(position_t)};

    for (edit_t const& edit : entry.edits)
    {
        rv += sizeof(edit_t);
        if (auto const* const e{std::get_if<insert_text_block_t>(&edit)})
        {
            rv += e->text.size() * sizeof(char32_t);
        }
        else if (auto const* const d{std::get_if<delete_range_t>(&edit)})
        {
            rv += d->text.size() * sizeof(char32_t);
        }
    }

    return rv;
}
