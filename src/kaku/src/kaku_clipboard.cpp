#include <kaku_clipboard.hpp>

#include <utility>

void kaku::memory_clipboard_t::set_text(std::u32string text)
{
    std::lock_guard const lock{mutex_};
    text_ = std::move(text);
}

std::u32string kaku::memory_clipboard_t::get_text() const
{
    std::lock_guard const lock{mutex_};
    return text_;
}
