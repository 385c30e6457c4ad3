#ifndef KAKU_DOCUMENT_INCLUDED
#define KAKU_DOCUMENT_INCLUDED

#include <kaku_position.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kaku
{
    // Text as an ordered sequence of lines of Unicode scalar values. There is
    // always at least one line. All columns are character indices.
    class [[nodiscard]] document_t final
    {
    public:
        document_t();

        explicit document_t(std::u32string_view text);

        document_t(document_t const&) = default;

        document_t(document_t&&) noexcept = default;

    public:
        ~document_t() = default;

    public:
        // Returns the position just past the inserted text.
        [[nodiscard]] std::expected<position_t, std::error_code>
        insert(position_t const& position, std::u32string_view text);

        // Returns the removed text, line breaks included.
        [[nodiscard]] std::expected<std::u32string, std::error_code> erase(
            range_t const& range);

        [[nodiscard]] std::expected<std::u32string_view, std::error_code> line(
            size_t index) const;

        [[nodiscard]] size_t line_count() const;

        [[nodiscard]] size_t line_length(size_t index) const;

        // The character after the position; a line break at the end of any
        // line but the last.
        [[nodiscard]] std::expected<char32_t, std::error_code> char_at(
            position_t const& position) const;

        [[nodiscard]] std::expected<std::u32string, std::error_code> text(
            range_t const& range) const;

        [[nodiscard]] std::u32string text() const;

        // Replaces the whole content. CRLF and CR line endings become LF.
        void set_text(std::u32string_view text);

        // Changes whenever the content of the line changes; never reused.
        [[nodiscard]] uint64_t line_revision(size_t index) const;

        [[nodiscard]] bool is_valid(position_t const& position) const;

        [[nodiscard]] bool is_valid(range_t const& range) const;

        [[nodiscard]] position_t clamp(position_t const& position) const;

        [[nodiscard]] position_t end() const;

        [[nodiscard]] size_t size() const;

    public:
        // Unchecked access, index must be below line_count().
        [[nodiscard]] std::u32string_view operator[](size_t index) const;

        document_t& operator=(document_t const&) = default;

        document_t& operator=(document_t&&) noexcept = default;

    private:
        struct [[nodiscard]] line_t final
        {
            std::u32string text;
            uint64_t revision{};
        };

    private:
        [[nodiscard]] uint64_t next_revision();

    private:
        std::vector<line_t> lines_;
        uint64_t revision_counter_{};
    };

    [[nodiscard]] std::vector<std::u32string_view> split_lines(
        std::u32string_view text);

    [[nodiscard]] size_t count_lines(std::u32string_view text);
} // namespace kaku

#endif
