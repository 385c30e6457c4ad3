#ifndef KAKU_CLIPBOARD_INCLUDED
#define KAKU_CLIPBOARD_INCLUDED

#include <mutex>
#include <string>

namespace kaku
{
    // NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
    class [[nodiscard]] clipboard_t
    {
    public: // Destruction
        virtual ~clipboard_t() = default;

    public: // Interface
        virtual void set_text(std::u32string text) = 0;

        [[nodiscard]] virtual std::u32string get_text() const = 0;
    };

    // Process local clipboard, used when no system clipboard is attached.
    class [[nodiscard]] memory_clipboard_t final : public clipboard_t
    {
    public:
        memory_clipboard_t() = default;

        memory_clipboard_t(memory_clipboard_t const&) = delete;

        memory_clipboard_t(memory_clipboard_t&&) noexcept = delete;

    public:
        ~memory_clipboard_t() override = default;

    public:
        void set_text(std::u32string text) override;

        [[nodiscard]] std::u32string get_text() const override;

    public:
        memory_clipboard_t& operator=(memory_clipboard_t const&) = delete;

        memory_clipboard_t& operator=(memory_clipboard_t&&) noexcept = delete;

    private:
        mutable std::mutex mutex_;
        std::u32string text_;
    };
} // namespace kaku

#endif
