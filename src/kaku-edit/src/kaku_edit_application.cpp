#include <kaku_edit_application.hpp>

#include <kaku_clipboard.hpp>
#include <kaku_config.hpp>
#include <kaku_document.hpp>
#include <kaku_find.hpp>
#include <kaku_session.hpp>
#include <kaku_unicode.hpp>

#include <fmt/format.h>
#include <fmt/std.h> // IWYU pragma: keep

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace
{
    [[nodiscard]] std::expected<std::u32string, std::error_code>
    decode_argument(std::string const& argument, std::string_view name)
    {
        auto rv{kaku::to_utf32(argument)};
        if (!rv)
        {
            spdlog::error("{} argument is not valid UTF-8", name);
        }
        return rv;
    }
} // namespace

kaku_edit::application_t::application_t(
    std::span<char const*> command_line_parameters)
    : config_{kaku::default_config()}
{
    process_command_line(command_line_parameters);
}

int kaku_edit::application_t::run()
{
    if (!valid_)
    {
        print_usage();
        return help_ ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    kaku::memory_clipboard_t clipboard;
    kaku::session_t session{config_, clipboard};
    if (auto const opened{session.open(file_)}; !opened)
    {
        spdlog::error("Failed to open {}: {}", file_, opened.error().message());
        return EXIT_FAILURE;
    }

    if (pattern_)
    {
        auto const pattern{decode_argument(*pattern_, "--find")};
        if (!pattern)
        {
            return EXIT_FAILURE;
        }

        session.find().set_mode(mode_);
        session.find().set_pattern(*pattern);
        session.refresh_find();
        session.find_history().add(*pattern);

        if (auto const& error{session.find().error()})
        {
            spdlog::error("Invalid pattern: {}", error->message);
            return EXIT_FAILURE;
        }

        if (filter_context_ && session.find().compiled())
        {
            kaku::document_t const& document{session.document()};
            std::vector<size_t> const lines{
                kaku::lines_with_matches(*session.find().compiled(),
                    document,
                    std::nullopt,
                    *filter_context_,
                    *filter_context_)};
            for (size_t const line : lines)
            {
                fmt::print("{}: {}\n", line + 1, kaku::to_utf8(document[line]));
            }
        }

        fmt::print("{} matches\n", session.find().hit_count().second);

        if (replacement_)
        {
            auto const replacement{decode_argument(*replacement_, "--replace")};
            if (!replacement)
            {
                return EXIT_FAILURE;
            }

            if (auto const replaced{kaku::replace_all(session.engine(),
                    session.document(),
                    session.find(),
                    *replacement)};
                !replaced)
            {
                spdlog::error("Replace failed: {}",
                    replaced.error().message());
                return EXIT_FAILURE;
            }

            if (session.modified())
            {
                if (auto const saved{session.save()}; !saved)
                {
                    spdlog::error("Failed to save {}: {}",
                        file_,
                        saved.error().message());
                    return EXIT_FAILURE;
                }
            }
        }
    }

    if (auto const flushed{session.flush_history()}; !flushed)
    {
        spdlog::warn("Undo history of {} was not written: {}",
            file_,
            flushed.error().message());
    }

    return EXIT_SUCCESS;
}

void kaku_edit::application_t::process_command_line(
    std::span<char const*> const& parameters)
{
    auto const has_argument = [&parameters](std::string_view s)
    { return std::ranges::contains(cbegin(parameters), cend(parameters), s); };

    if (has_argument("--trace"))
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (has_argument("--debug"))
    {
        spdlog::set_level(spdlog::level::debug);
    }

    if (has_argument("--help"))
    {
        help_ = true;
        valid_ = false;
        return;
    }

    for (size_t i{1}; i < parameters.size(); ++i)
    {
        std::string_view const argument{parameters[i]};

        auto const value = [&]() -> char const*
        {
            if (i + 1 == parameters.size())
            {
                spdlog::error("{} requires a value", argument);
                valid_ = false;
                return nullptr;
            }
            return parameters[++i];
        };

        if (argument == "--trace" || argument == "--debug")
        {
            continue;
        }

        if (argument == "--find")
        {
            if (char const* const v{value()})
            {
                pattern_ = v;
            }
        }
        else if (argument == "--replace")
        {
            if (char const* const v{value()})
            {
                replacement_ = v;
            }
        }
        else if (argument == "--filter")
        {
            if (char const* const v{value()})
            {
                std::string_view const text{v};
                size_t context{};
                auto const [ptr, ec]{std::from_chars(text.data(),
                    text.data() + text.size(),
                    context)};
                if (ec != std::errc{} || ptr != text.data() + text.size())
                {
                    spdlog::error("Invalid --filter context '{}'", text);
                    valid_ = false;
                }
                filter_context_ = context;
            }
        }
        else if (argument == "--history-root")
        {
            if (char const* const v{value()})
            {
                config_.history_root = v;
            }
        }
        else if (argument == "--wildcard")
        {
            mode_ = kaku::pattern_mode_t::wildcard;
        }
        else if (argument == "--case-sensitive")
        {
            config_.case_sensitive = true;
        }
        else if (argument == "--no-history")
        {
            config_.persist_history = false;
        }
        else if (argument.starts_with("--") || !file_.empty())
        {
            spdlog::error("Unexpected argument '{}'", argument);
            valid_ = false;
        }
        else
        {
            file_ = argument;
        }
    }

    if (file_.empty())
    {
        valid_ = false;
    }

    if (replacement_ && !pattern_)
    {
        spdlog::error("--replace requires --find");
        valid_ = false;
    }
}

void kaku_edit::application_t::print_usage()
{
    fmt::print(stderr,
        "Usage: kaku-edit [--trace|--debug] [--find PATTERN [--replace "
        "TEMPLATE] [--filter CONTEXT] [--wildcard] [--case-sensitive]]\n"
        "                 [--no-history] [--history-root DIR] FILE\n");
}
