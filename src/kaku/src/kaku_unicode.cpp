#include <kaku_unicode.hpp>

#include <kaku_error.hpp>

#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>

#include <spdlog/spdlog.h>

#include <expected>

std::expected<std::u32string, std::error_code> kaku::to_utf32(
    std::string_view const text)
{
    try
    {
        return boost::locale::conv::utf_to_utf<char32_t>(text.data(),
            text.data() + text.size(),
            boost::locale::conv::stop);
    }
    catch (boost::locale::conv::conversion_error const& ex)
    {
        spdlog::debug("UTF-8 decoding failed: {}", ex.what());
        return std::unexpected{make_error_code(error_t::invalid_encoding)};
    }
}

std::string kaku::to_utf8(std::u32string_view const text)
{
    return boost::locale::conv::utf_to_utf<char>(text.data(),
        text.data() + text.size());
}

bool kaku::is_word_char(char32_t const c)
{
    if (c < 0x80)
    {
        return (c >= U'a' && c <= U'z') ||
            (c >= U'A' && c <= U'Z') ||
            (c >= U'0' && c <= U'9') ||
            c == U'_';
    }

    // Latin-1 punctuation, general punctuation and CJK symbols separate words,
    // everything else outside ASCII is treated as a letter.
    bool const latin1_separator{c <= 0xBF || c == 0xD7 || c == 0xF7};
    bool const general_punctuation{c >= 0x2000 && c <= 0x206F};
    bool const cjk_punctuation{c >= 0x3000 && c <= 0x303F};
    return !latin1_separator && !general_punctuation && !cjk_punctuation;
}
