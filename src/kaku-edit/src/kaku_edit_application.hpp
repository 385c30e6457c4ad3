#ifndef KAKU_EDIT_APPLICATION_INCLUDED
#define KAKU_EDIT_APPLICATION_INCLUDED

#include <kaku_config.hpp>
#include <kaku_find.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace kaku_edit
{
    class [[nodiscard]] application_t final
    {
    public:
        explicit application_t(std::span<char const*> command_line_parameters);

        application_t(application_t const&) = default;

        application_t(application_t&&) noexcept = default;

    public:
        ~application_t() = default;

    public:
        // Process exit code.
        [[nodiscard]] int run();

    public:
        application_t& operator=(application_t const&) = default;

        application_t& operator=(application_t&&) noexcept = default;

    private:
        void process_command_line(std::span<char const*> const& parameters);

        static void print_usage();

    private:
        kaku::config_t config_;
        std::filesystem::path file_;
        std::optional<std::string> pattern_;
        std::optional<std::string> replacement_;
        std::optional<size_t> filter_context_;
        kaku::pattern_mode_t mode_{kaku::pattern_mode_t::regex};
        bool valid_{true};
        bool help_{false};
    };
} // namespace kaku_edit

#endif // !KAKU_EDIT_APPLICATION_INCLUDED
