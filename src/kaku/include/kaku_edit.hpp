#ifndef KAKU_EDIT_INCLUDED
#define KAKU_EDIT_INCLUDED

#include <kaku_position.hpp>
#include <kaku_selection.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace kaku
{
    class document_t;
} // namespace kaku

namespace kaku
{
    struct [[nodiscard]] insert_char_t final
    {
        position_t position;
        char32_t character{};

        [[nodiscard]] bool operator==(insert_char_t const&) const = default;
    };

    // Removes the character left of position.
    struct [[nodiscard]] delete_char_before_t final
    {
        position_t position;
        char32_t character{};

        [[nodiscard]] bool operator==(
            delete_char_before_t const&) const = default;
    };

    // Removes the character right of position.
    struct [[nodiscard]] delete_char_after_t final
    {
        position_t position;
        char32_t character{};

        [[nodiscard]] bool operator==(
            delete_char_after_t const&) const = default;
    };

    struct [[nodiscard]] split_line_t final
    {
        position_t position;

        [[nodiscard]] bool operator==(split_line_t const&) const = default;
    };

    // Joins position.line with the next one, position.col is the length of
    // the line before joining.
    struct [[nodiscard]] join_line_t final
    {
        position_t position;

        [[nodiscard]] bool operator==(join_line_t const&) const = default;
    };

    struct [[nodiscard]] insert_text_block_t final
    {
        position_t position;
        std::u32string text;

        [[nodiscard]] bool operator==(
            insert_text_block_t const&) const = default;
    };

    struct [[nodiscard]] delete_range_t final
    {
        range_t range;
        std::u32string text;

        [[nodiscard]] bool operator==(delete_range_t const&) const = default;
    };

    using edit_t = std::variant<insert_char_t,
        delete_char_before_t,
        delete_char_after_t,
        split_line_t,
        join_line_t,
        insert_text_block_t,
        delete_range_t>;

    // Edits applied as one unit, with the cursors around them.
    struct [[nodiscard]] history_entry_t final
    {
        std::vector<edit_t> edits;
        cursor_state_t before;
        cursor_state_t after;

        [[nodiscard]] bool operator==(history_entry_t const&) const = default;
    };

    [[nodiscard]] edit_t invert(edit_t const& edit);

    // Deletions verify the recorded content, a difference is reported as
    // error_t::history_mismatch and nothing is changed.
    [[nodiscard]] std::expected<void, std::error_code> apply(
        document_t& document,
        edit_t const& edit);

    // Where a position ends up once the edit is applied. Positions inside
    // removed text collapse to the start of the removal.
    [[nodiscard]] position_t transform(position_t const& position,
        edit_t const& edit);

    // Position just past text inserted at start.
    [[nodiscard]] position_t end_of(position_t const& start,
        std::u32string_view text);

    // Approximate memory held by the entry.
    [[nodiscard]] size_t content_size(history_entry_t const& entry);
} // namespace kaku

#endif
