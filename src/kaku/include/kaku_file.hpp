#ifndef KAKU_FILE_INCLUDED
#define KAKU_FILE_INCLUDED

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
    struct [[nodiscard]] content_digest_t final
    {
        uint32_t crc{};
        size_t size{};

        [[nodiscard]] bool operator==(content_digest_t const&) const = default;
    };

    // CRC-32 and length of the bytes.
    [[nodiscard]] content_digest_t content_digest(std::string_view content);

    [[nodiscard]] std::expected<std::string, std::error_code> read_file(
        std::filesystem::path const& path);

    // Writes to a sibling temporary file and renames it over the target,
    // the target is either fully replaced or left untouched.
    [[nodiscard]] std::expected<void, std::error_code> write_file(
        std::filesystem::path const& path,
        std::string_view content);

    // Creates the file and its parent directories when missing.
    [[nodiscard]] std::expected<void, std::error_code> append_file(
        std::filesystem::path const& path,
        std::string_view content);

    // Seconds since the UNIX epoch, empty when the file can't be inspected.
    [[nodiscard]] std::optional<int64_t> file_timestamp(
        std::filesystem::path const& path);
} // namespace kaku

#endif
