#ifndef KAKU_SESSION_INCLUDED
#define KAKU_SESSION_INCLUDED

#include <kaku_config.hpp>
#include <kaku_coordinate_mapper.hpp>
#include <kaku_document.hpp>
#include <kaku_edit_engine.hpp>
#include <kaku_file.hpp>
#include <kaku_find.hpp>
#include <kaku_history_log.hpp>
#include <kaku_selection.hpp>
#include <kaku_undo_history.hpp>

#include <cppext_serial_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

namespace kaku
{
    class clipboard_t;
} // namespace kaku

namespace kaku
{
    // One open document with everything editing it. History log writes run
    // in order on a background thread and never touch the document.
    class [[nodiscard]] session_t final
    {
    public:
        session_t(config_t config, clipboard_t& clipboard);

        session_t(session_t const&) = delete;

        session_t(session_t&&) noexcept = delete;

    public:
        ~session_t();

    public:
        // A missing file opens as an empty document. The persisted history
        // is kept only when it still describes the file on disk. Without a
        // store the history is kept under the configured history root,
        // unless persistence is disabled.
        [[nodiscard]] std::expected<void, std::error_code> open(
            std::filesystem::path path,
            std::shared_ptr<history_store_t> store = nullptr);

        // A failed write leaves the document and history as they were.
        [[nodiscard]] std::expected<void, std::error_code> save();

        // Rewrites the log as a snapshot of the current history.
        std::shared_future<std::expected<void, std::error_code>>
        compact_history();

        // Waits for pending log writes, returns the result of the last one.
        [[nodiscard]] std::expected<void, std::error_code> flush_history();

        // Recomputes the matches of the find state against the document.
        void refresh_find(std::stop_token const& stop_token = {});

        [[nodiscard]] visual_position_t cursor_visual_position();

        void set_view(view_state_t const& view);

        [[nodiscard]] view_state_t const& view() const;

        [[nodiscard]] bool modified() const;

        [[nodiscard]] validation_result_t validation() const;

        [[nodiscard]] std::filesystem::path const& path() const;

        [[nodiscard]] config_t const& config() const;

        [[nodiscard]] document_t const& document() const;

        [[nodiscard]] selection_model_t& selection();

        [[nodiscard]] undo_history_t const& history() const;

        [[nodiscard]] edit_engine_t& engine();

        [[nodiscard]] find_state_t& find();

        [[nodiscard]] find_history_t& find_history();

        [[nodiscard]] coordinate_mapper_t& mapper();

    public:
        session_t& operator=(session_t const&) = delete;

        session_t& operator=(session_t&&) noexcept = delete;

    private:
        void on_history_event(history_event_t const& event);

        std::shared_future<std::expected<void, std::error_code>> write_log(
            std::string records,
            bool replace);

    private:
        config_t config_;
        std::filesystem::path path_;
        std::optional<int64_t> file_timestamp_;
        std::optional<content_digest_t> file_digest_;
        size_t evicted_since_compaction_{};
        validation_result_t validation_{validation_result_t::valid};
        view_state_t view_;

        document_t document_;
        selection_model_t selection_;
        undo_history_t history_;
        edit_engine_t engine_;
        find_state_t find_;
        find_history_t find_history_;
        coordinate_mapper_t mapper_;

        std::shared_ptr<history_store_t> store_;
        std::shared_future<std::expected<void, std::error_code>> last_write_;
        cppext::serial_executor_t log_writer_;
    };
} // namespace kaku

#endif
