#ifndef KAKU_EDIT_ENGINE_INCLUDED
#define KAKU_EDIT_ENGINE_INCLUDED

#include <kaku_edit.hpp>
#include <kaku_position.hpp>
#include <kaku_selection.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace kaku
{
    class clipboard_t;
    class document_t;
    class undo_history_t;
} // namespace kaku

namespace kaku
{
    enum class history_event_kind_t : uint8_t
    {
        push,
        undo,
        redo
    };

    struct [[nodiscard]] history_event_t final
    {
        history_event_kind_t kind{};
        history_entry_t const* entry{};
        size_t evicted{};
    };

    // Entry committed by the operation, empty when nothing changed.
    using edit_result_t =
        std::expected<std::optional<history_entry_t>, std::error_code>;

    class [[nodiscard]] edit_engine_t final
    {
    public:
        using history_listener_t = std::function<void(history_event_t const&)>;

    public:
        edit_engine_t(document_t& document,
            selection_model_t& selection,
            undo_history_t& history,
            clipboard_t& clipboard);

        edit_engine_t(edit_engine_t const&) = delete;

        edit_engine_t(edit_engine_t&&) noexcept = delete;

    public:
        ~edit_engine_t() = default;

    public:
        // Called after every push, undo and redo of the history.
        void set_history_listener(history_listener_t listener);

        edit_result_t insert_text(std::u32string_view text);

        edit_result_t delete_backward();

        edit_result_t delete_forward();

        edit_result_t split_line(position_t const& position);

        edit_result_t split_line();

        edit_result_t join_line(size_t line_index);

        edit_result_t insert_tab(size_t tab_width);

        edit_result_t delete_word_backward();

        edit_result_t delete_word_forward();

        // False when there is nothing selected.
        bool copy();

        edit_result_t cut();

        edit_result_t paste();

        edit_result_t replace_range(range_t const& range,
            std::u32string_view text);

        // Ranges must not overlap, cursors stay where they are.
        edit_result_t replace_ranges(
            std::vector<std::pair<range_t, std::u32string>> replacements);

        // Moves or copies the source text to destination. Destinations
        // inside the source leave everything untouched.
        edit_result_t move_block(range_t const& source,
            position_t const& destination,
            bool copy);

        [[nodiscard]] std::expected<void, std::error_code> apply_undo(
            history_entry_t const& entry);

        [[nodiscard]] std::expected<void, std::error_code> apply_redo(
            history_entry_t const& entry);

        edit_result_t undo();

        edit_result_t redo();

    public:
        edit_engine_t& operator=(edit_engine_t const&) = delete;

        edit_engine_t& operator=(edit_engine_t&&) noexcept = delete;

    private:
        template<typename Function>
        edit_result_t run(Function&& function);

        edit_result_t commit(std::vector<edit_t> edits,
            cursor_state_t const& before);

        void notify(history_event_kind_t kind,
            history_entry_t const& entry,
            size_t evicted) const;

    private:
        document_t* document_;
        selection_model_t* selection_;
        undo_history_t* history_;
        clipboard_t* clipboard_;
        history_listener_t listener_;
    };
} // namespace kaku

#endif
