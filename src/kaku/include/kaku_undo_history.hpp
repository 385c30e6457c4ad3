#ifndef KAKU_UNDO_HISTORY_INCLUDED
#define KAKU_UNDO_HISTORY_INCLUDED

#include <kaku_edit.hpp>

#include <cstddef>
#include <deque>
#include <expected>
#include <optional>
#include <system_error>
#include <vector>

namespace kaku
{
    struct [[nodiscard]] history_limits_t final
    {
        size_t max_entries{1000};
        size_t max_bytes{size_t{64} * 1024 * 1024};
    };

    // Entries [0, current) can be undone, [current, size) redone.
    class [[nodiscard]] undo_history_t final
    {
    public:
        explicit undo_history_t(history_limits_t const& limits = {});

        undo_history_t(undo_history_t const&) = default;

        undo_history_t(undo_history_t&&) noexcept = default;

    public:
        ~undo_history_t() = default;

    public:
        // Drops the redo entries. Returns the number of entries evicted to
        // stay within limits.
        size_t push(history_entry_t entry);

        [[nodiscard]] std::optional<history_entry_t> undo();

        [[nodiscard]] std::optional<history_entry_t> redo();

        [[nodiscard]] bool can_undo() const;

        [[nodiscard]] bool can_redo() const;

        void mark_saved();

        // True when the current entry differs from the one at the last save.
        [[nodiscard]] bool modified() const;

        [[nodiscard]] std::deque<history_entry_t> const& entries() const;

        [[nodiscard]] size_t current() const;

        // Empty once the saved state has been evicted.
        [[nodiscard]] std::optional<size_t> saved_at() const;

        [[nodiscard]] size_t content_bytes() const;

        [[nodiscard]] history_limits_t const& limits() const;

        // Replaces the whole state, used when loading a persisted history.
        [[nodiscard]] std::expected<void, std::error_code> restore(
            std::vector<history_entry_t> entries,
            size_t current,
            std::optional<size_t> saved_at);

        void clear();

    public:
        undo_history_t& operator=(undo_history_t const&) = default;

        undo_history_t& operator=(undo_history_t&&) noexcept = default;

    private:
        size_t evict();

    private:
        history_limits_t limits_;
        std::deque<history_entry_t> entries_;
        size_t current_{};
        std::optional<size_t> saved_at_{0};
        size_t bytes_{};
    };
} // namespace kaku

#endif
