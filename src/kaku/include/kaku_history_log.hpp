#ifndef KAKU_HISTORY_LOG_INCLUDED
#define KAKU_HISTORY_LOG_INCLUDED

#include <kaku_edit.hpp>
#include <kaku_file.hpp>
#include <kaku_position.hpp>
#include <kaku_undo_history.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace kaku
{
    inline constexpr int history_log_version{1};

    struct [[nodiscard]] view_state_t final
    {
        size_t top_line{};
        position_t cursor;

        [[nodiscard]] bool operator==(view_state_t const&) const = default;
    };

    enum class validation_result_t : uint8_t
    {
        valid,
        modified_no_unsaved,
        modified_with_unsaved
    };

    // NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
    class [[nodiscard]] history_store_t
    {
    public: // Destruction
        virtual ~history_store_t() = default;

    public: // Interface
        [[nodiscard]] virtual std::expected<void, std::error_code> append(
            std::string_view records) = 0;

        [[nodiscard]] virtual std::expected<void, std::error_code> replace(
            std::string_view records) = 0;

        // An absent log loads as empty.
        [[nodiscard]] virtual std::expected<std::string, std::error_code>
        load() const = 0;
    };

    class [[nodiscard]] memory_history_store_t final : public history_store_t
    {
    public:
        memory_history_store_t() = default;

        memory_history_store_t(memory_history_store_t const&) = default;

        memory_history_store_t(memory_history_store_t&&) noexcept = default;

    public:
        ~memory_history_store_t() override = default;

    public:
        [[nodiscard]] std::expected<void, std::error_code> append(
            std::string_view records) override;

        [[nodiscard]] std::expected<void, std::error_code> replace(
            std::string_view records) override;

        [[nodiscard]] std::expected<std::string, std::error_code>
        load() const override;

    public:
        memory_history_store_t& operator=(
            memory_history_store_t const&) = default;

        memory_history_store_t& operator=(
            memory_history_store_t&&) noexcept = default;

    private:
        std::string content_;
    };

    class [[nodiscard]] file_history_store_t final : public history_store_t
    {
    public:
        explicit file_history_store_t(std::filesystem::path path);

        file_history_store_t(file_history_store_t const&) = default;

        file_history_store_t(file_history_store_t&&) noexcept = default;

    public:
        ~file_history_store_t() override = default;

    public:
        // <root>/files/<absolute document path>.ue
        [[nodiscard]] static std::filesystem::path path_for(
            std::filesystem::path const& root,
            std::filesystem::path const& document);

        [[nodiscard]] std::filesystem::path const& path() const;

        [[nodiscard]] std::expected<void, std::error_code> append(
            std::string_view records) override;

        [[nodiscard]] std::expected<void, std::error_code> replace(
            std::string_view records) override;

        [[nodiscard]] std::expected<std::string, std::error_code>
        load() const override;

    public:
        file_history_store_t& operator=(file_history_store_t const&) = default;

        file_history_store_t& operator=(
            file_history_store_t&&) noexcept = default;

    private:
        std::filesystem::path path_;
    };

    // Each record is one JSON document terminated by a line break.
    // The header describes the file the history was recorded against.
    [[nodiscard]] std::string header_record(
        std::optional<int64_t> file_timestamp,
        std::optional<content_digest_t> const& file_digest,
        bool saved_baseline = true);

    [[nodiscard]] std::string push_record(history_entry_t const& entry);

    [[nodiscard]] std::string undo_record();

    [[nodiscard]] std::string redo_record();

    [[nodiscard]] std::string saved_record();

    [[nodiscard]] std::string cursor_record(view_state_t const& view);

    // Minimal record stream that replays to the given history.
    [[nodiscard]] std::string snapshot(undo_history_t const& history,
        std::optional<int64_t> file_timestamp,
        std::optional<content_digest_t> const& file_digest,
        view_state_t const& view);

    struct [[nodiscard]] loaded_history_t final
    {
        undo_history_t history;
        std::optional<int64_t> file_timestamp;
        view_state_t view;
        std::optional<content_digest_t> file_digest;
    };

    // Malformed logs are reported as error_t::persistence_error.
    [[nodiscard]] std::expected<loaded_history_t, std::error_code>
    parse_log(std::string_view log, history_limits_t const& limits);

    // Never fails, a log that can't be replayed gives an empty history.
    [[nodiscard]] loaded_history_t load_history(history_store_t const& store,
        history_limits_t const& limits);

    // Compares content digests when both sides have one, timestamps
    // otherwise.
    [[nodiscard]] validation_result_t validate(loaded_history_t const& loaded,
        std::optional<int64_t> current_file_timestamp,
        std::optional<content_digest_t> const& current_file_digest);
} // namespace kaku

#endif
