#ifndef KAKU_UNICODE_INCLUDED
#define KAKU_UNICODE_INCLUDED

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace kaku
{
    // Invalid UTF-8 is reported as error_t::invalid_encoding.
    [[nodiscard]] std::expected<std::u32string, std::error_code> to_utf32(
        std::string_view text);

    [[nodiscard]] std::string to_utf8(std::u32string_view text);

    [[nodiscard]] bool is_word_char(char32_t c);
} // namespace kaku

#endif
