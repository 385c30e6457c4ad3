#ifndef KAKU_SELECTION_INCLUDED
#define KAKU_SELECTION_INCLUDED

#include <kaku_position.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kaku
{
    class document_t;
} // namespace kaku

namespace kaku
{
    enum class selection_kind_t : uint8_t
    {
        line,
        block
    };

    struct [[nodiscard]] no_selection_t final
    {
        [[nodiscard]] constexpr bool operator==(
            no_selection_t const&) const = default;
    };

    // Contiguous text between anchor and active in document order.
    struct [[nodiscard]] line_selection_t final
    {
        position_t anchor;
        position_t active;

        [[nodiscard]] constexpr bool operator==(
            line_selection_t const&) const = default;
    };

    // Rectangle spanned by anchor and active. Equal columns make a zero width
    // block, a column insertion point on every row.
    struct [[nodiscard]] block_selection_t final
    {
        position_t anchor;
        position_t active;

        [[nodiscard]] constexpr bool operator==(
            block_selection_t const&) const = default;
    };

    using selection_t =
        std::variant<no_selection_t, line_selection_t, block_selection_t>;

    // Rows [first_line, last_line], columns [start_col, end_col).
    struct [[nodiscard]] block_region_t final
    {
        size_t first_line{};
        size_t last_line{};
        size_t start_col{};
        size_t end_col{};

        [[nodiscard]] constexpr bool zero_width() const
        {
            return start_col == end_col;
        }

        [[nodiscard]] constexpr size_t rows() const
        {
            return last_line - first_line + 1;
        }

        [[nodiscard]] constexpr bool operator==(
            block_region_t const&) const = default;
    };

    struct [[nodiscard]] cursor_state_t final
    {
        position_t primary;
        std::vector<position_t> others;

        [[nodiscard]] bool operator==(cursor_state_t const&) const = default;
    };

    [[nodiscard]] block_region_t normalize(block_selection_t const& block);

    // Per row span of the block clamped to the row length. Rows shorter than
    // the start column give an empty range at their end.
    [[nodiscard]] std::vector<range_t> block_row_ranges(
        block_region_t const& region,
        document_t const& document);

    // One string per block row, one for a line selection, none otherwise.
    [[nodiscard]] std::vector<std::u32string>
    extract_text(selection_t const& selection, document_t const& document);

    class [[nodiscard]] selection_model_t final
    {
    public:
        selection_model_t() = default;

        selection_model_t(selection_model_t const&) = default;

        selection_model_t(selection_model_t&&) noexcept = default;

    public:
        ~selection_model_t() = default;

    public:
        // Anchors a new selection at the position and moves the primary
        // cursor there. Additional cursors are dropped.
        void start_selection(position_t const& position, selection_kind_t kind);

        // Moves the active end and the primary cursor. Starts a line
        // selection at the primary cursor if none is active.
        void extend_selection(position_t const& position);

        void clear_selection();

        [[nodiscard]] selection_t const& selection() const;

        // False for an empty line selection and for a zero width block.
        [[nodiscard]] bool has_selection() const;

        [[nodiscard]] bool has_zero_width_block() const;

        [[nodiscard]] std::optional<range_t> normalized_range() const;

        [[nodiscard]] std::optional<block_region_t> normalized_block() const;

        bool add_cursor_above(document_t const& document);

        bool add_cursor_below(document_t const& document);

        // Primary cursor first, the rest in document order.
        [[nodiscard]] std::vector<position_t> cursors() const;

        [[nodiscard]] position_t primary() const;

        void set_primary(position_t const& position);

        void set_cursors(position_t const& primary,
            std::vector<position_t> others);

        void merge_duplicates();

        [[nodiscard]] bool has_multi_cursors() const;

        // Plain cursor movement, collapses to the primary cursor.
        void navigate(position_t const& position);

        // Turns a zero width block into one cursor per row, the primary on
        // the first row.
        bool cursors_from_zero_width_block(document_t const& document);

        [[nodiscard]] cursor_state_t cursor_state() const;

        // Clears the selection.
        void restore(cursor_state_t const& state);

        // Keeps every cursor and selection end inside the document.
        void clamp(document_t const& document);

        // One empty string per cursor when nothing is selected.
        [[nodiscard]] std::vector<std::u32string> extract_text(
            document_t const& document) const;

        // Block rows joined with line breaks.
        [[nodiscard]] std::u32string selection_text(
            document_t const& document) const;

    public:
        selection_model_t& operator=(selection_model_t const&) = default;

        selection_model_t& operator=(selection_model_t&&) noexcept = default;

    private:
        selection_t selection_;
        position_t primary_;
        std::vector<position_t> others_;
    };
} // namespace kaku

#endif
