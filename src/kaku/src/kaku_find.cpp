#include <kaku_find.hpp>

#include <kaku_document.hpp>
#include <kaku_error.hpp>
#include <kaku_unicode.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

static_assert(sizeof(wchar_t) == sizeof(char32_t),
    "regular expressions run on wide strings holding code points");

namespace
{
    boost::match_flag_type const search_flags{
        boost::match_default | boost::match_not_dot_newline};

    [[nodiscard]] std::wstring to_wide(std::u32string_view const text)
    {
        return {text.begin(), text.end()};
    }

    [[nodiscard]] std::u32string from_wide(std::wstring_view const text)
    {
        return {text.begin(), text.end()};
    }

    // True when the pattern has an unescaped \n token.
    [[nodiscard]] bool names_line_break(std::u32string_view const pattern)
    {
        for (size_t i{}; i + 1 < pattern.size(); ++i)
        {
            if (pattern[i] == U'\\')
            {
                if (pattern[i + 1] == U'n')
                {
                    return true;
                }
                ++i;
            }
        }
        return false;
    }

    [[nodiscard]] bool is_name_char(char32_t const c)
    {
        return (c >= U'a' && c <= U'z') ||
            (c >= U'A' && c <= U'Z') ||
            (c >= U'0' && c <= U'9') ||
            c == U'_';
    }

    [[nodiscard]] std::optional<size_t> group_number(
        std::u32string_view const name)
    {
        if (name.empty() || name.size() > 9)
        {
            return std::nullopt;
        }

        size_t rv{};
        for (char32_t const c : name)
        {
            if (c < U'0' || c > U'9')
            {
                return std::nullopt;
            }
            rv = rv * 10 + static_cast<size_t>(c - U'0');
        }
        return rv;
    }

    // Columns of the line covered by the region.
    [[nodiscard]] std::pair<size_t, size_t> line_span(
        kaku::document_t const& document,
        size_t const line,
        kaku::range_t const& region)
    {
        size_t const length{document.line_length(line)};
        size_t const from{line == region.start.line ? region.start.col : 0};
        size_t const to{
            line == region.end.line ? std::min(region.end.col, length) : length};
        return {std::min(from, to), to};
    }

    // Visits matches of text lying within [from, to). The engine sees the
    // whole text, so anchors, word boundaries and lookaround respect what
    // surrounds the span. Returns false when the visitor stopped.
    template<typename Visitor>
    bool search_text(boost::wregex const& regex,
        std::wstring const& text,
        size_t const from,
        size_t const to,
        Visitor&& visitor)
    {
        auto const begin{text.cbegin()};
        auto const end{text.cend()};

        auto position{std::next(begin, static_cast<std::ptrdiff_t>(from))};
        boost::match_flag_type flags{search_flags};
        if (from != 0)
        {
            flags |= boost::match_prev_avail;
        }

        kaku::regex_match_t match;
        while (boost::regex_search(position, end, match, regex, flags, begin))
        {
            auto const& whole{match[0]};
            auto const first{
                static_cast<size_t>(std::distance(begin, whole.first))};
            auto const last{
                static_cast<size_t>(std::distance(begin, whole.second))};
            if (first >= to)
            {
                break;
            }

            if (first != last && last <= to && !visitor(first, last, match))
            {
                return false;
            }

            position = whole.second;
            flags = search_flags | boost::match_prev_avail;
            if (first == last)
            {
                if (position == end)
                {
                    break;
                }
                flags |= boost::regex_constants::match_not_initial_null;
            }
        }
        return true;
    }

    // Visits every match of the region in document order until the visitor
    // returns false.
    template<typename Visitor>
    void visit_matches(kaku::compiled_pattern_t const& pattern,
        kaku::document_t const& document,
        kaku::range_t const& region,
        std::stop_token const& stop_token,
        Visitor&& visitor)
    {
        if (!pattern.multi_line())
        {
            for (size_t line{region.start.line}; line <= region.end.line;
                ++line)
            {
                if (stop_token.stop_requested())
                {
                    spdlog::debug("Search stopped at line {}", line);
                    return;
                }

                auto const [from, to] = line_span(document, line, region);
                if (from == to)
                {
                    continue;
                }

                if (!search_text(pattern.regex(),
                        to_wide(document[line]),
                        from,
                        to,
                        [&visitor, line](size_t const first,
                            size_t const last,
                            kaku::regex_match_t const& match)
                        {
                            return visitor(
                                kaku::range_t{{line, first}, {line, last}},
                                match);
                        }))
                {
                    return;
                }
            }
            return;
        }

        if (stop_token.stop_requested())
        {
            return;
        }

        std::wstring joined;
        std::vector<size_t> line_starts;
        for (size_t line{region.start.line}; line <= region.end.line; ++line)
        {
            if (line != region.start.line)
            {
                joined += L'\n';
            }
            line_starts.push_back(joined.size());
            joined += to_wide(document[line]);
        }

        auto const to_position = [&](size_t const offset)
        {
            auto const it{std::ranges::upper_bound(line_starts, offset)};
            auto const index{
                static_cast<size_t>(std::ranges::distance(line_starts.begin(),
                    it)) -
                1};
            return kaku::position_t{region.start.line + index,
                offset - line_starts[index]};
        };

        search_text(pattern.regex(),
            joined,
            region.start.col,
            line_starts.back() + region.end.col,
            [&](size_t const first,
                size_t const last,
                kaku::regex_match_t const& match)
            {
                return visitor(
                    kaku::range_t{to_position(first), to_position(last)},
                    match);
            });
    }

    [[nodiscard]] kaku::range_t search_region(kaku::document_t const& document,
        std::optional<kaku::range_t> const& scope)
    {
        return scope ? *scope : kaku::range_t{{}, document.end()};
    }
} // namespace

kaku::compiled_pattern_t::compiled_pattern_t(boost::wregex regex,
    bool const multi_line)
    : regex_{std::move(regex)}
    , multi_line_{multi_line}
{
}

boost::wregex const& kaku::compiled_pattern_t::regex() const
{
    return regex_;
}

bool kaku::compiled_pattern_t::multi_line() const { return multi_line_; }

std::u32string kaku::wildcard_to_regex(std::u32string_view const pattern)
{
    static constexpr std::u32string_view special{U".^$+|()[]{}\\"};

    std::u32string rv;
    rv.reserve(pattern.size() * 2);
    for (char32_t const c : pattern)
    {
        if (c == U'*')
        {
            rv += U".*";
        }
        else if (c == U'?')
        {
            rv += U'.';
        }
        else
        {
            if (special.find(c) != std::u32string_view::npos)
            {
                rv += U'\\';
            }
            rv += c;
        }
    }
    return rv;
}

std::expected<kaku::compiled_pattern_t, kaku::pattern_error_t> kaku::compile(
    std::u32string_view const pattern,
    pattern_mode_t const mode,
    bool const case_sensitive)
{
    std::u32string source{mode == pattern_mode_t::wildcard
            ? wildcard_to_regex(pattern)
            : std::u32string{pattern}};
    if (!case_sensitive)
    {
        source.insert(0, U"(?i)");
    }

    try
    {
        return compiled_pattern_t{
            boost::wregex{to_wide(source), boost::regex_constants::perl},
            mode == pattern_mode_t::regex && names_line_break(pattern)};
    }
    catch (boost::regex_error const& ex)
    {
        spdlog::debug("Pattern '{}' rejected: {}", to_utf8(pattern), ex.what());
        return std::unexpected{
            pattern_error_t{make_error_code(error_t::pattern_error),
                ex.what()}};
    }
}

std::vector<kaku::range_t> kaku::find_all(compiled_pattern_t const& pattern,
    document_t const& document,
    std::optional<range_t> const& scope,
    std::stop_token const& stop_token)
{
    std::vector<range_t> rv;

    range_t const region{search_region(document, scope)};
    if (!document.is_valid(region))
    {
        return rv;
    }

    try
    {
        visit_matches(pattern,
            document,
            region,
            stop_token,
            [&rv](range_t const& range, regex_match_t const&)
            {
                rv.push_back(range);
                return true;
            });
    }
    catch (std::runtime_error const& ex)
    {
        spdlog::warn("Search aborted after {} matches: {}", rv.size(), ex.what());
    }

    return rv;
}

std::optional<kaku::found_t> kaku::next(std::span<range_t const> const matches,
    position_t const& from)
{
    if (matches.empty())
    {
        return std::nullopt;
    }

    auto const it{std::ranges::upper_bound(matches, from, {}, &range_t::start)};
    if (it == matches.end())
    {
        return found_t{matches.front(), 0, true};
    }

    return found_t{*it,
        static_cast<size_t>(std::distance(matches.begin(), it)),
        false};
}

std::optional<kaku::found_t> kaku::previous(
    std::span<range_t const> const matches,
    position_t const& from)
{
    if (matches.empty())
    {
        return std::nullopt;
    }

    auto const it{std::ranges::lower_bound(matches, from, {}, &range_t::start)};
    if (it == matches.begin())
    {
        return found_t{matches.back(), matches.size() - 1, true};
    }

    auto const index{
        static_cast<size_t>(std::distance(matches.begin(), it)) - 1};
    return found_t{matches[index], index, false};
}

std::u32string kaku::expand_template(regex_match_t const& match,
    std::u32string_view const replacement)
{
    auto const group = [&match](std::u32string_view const name)
        -> std::u32string
    {
        if (std::optional<size_t> const number{group_number(name)})
        {
            if (*number < match.size() && match[*number].matched)
            {
                return from_wide(match[*number].str());
            }
            return {};
        }

        auto const& sub{match[to_wide(name)]};
        return sub.matched ? from_wide(sub.str()) : std::u32string{};
    };

    std::u32string rv;
    size_t i{};
    while (i < replacement.size())
    {
        char32_t const c{replacement[i]};
        if (c != U'$' || i + 1 == replacement.size())
        {
            rv += c;
            ++i;
            continue;
        }

        char32_t const following{replacement[i + 1]};
        if (following == U'$')
        {
            rv += U'$';
            i += 2;
        }
        else if (following == U'{')
        {
            size_t const close{replacement.find(U'}', i + 2)};
            if (close == std::u32string_view::npos)
            {
                rv += c;
                ++i;
                continue;
            }
            rv += group(replacement.substr(i + 2, close - i - 2));
            i = close + 1;
        }
        else if (is_name_char(following))
        {
            size_t end{i + 1};
            while (end < replacement.size() && is_name_char(replacement[end]))
            {
                ++end;
            }
            rv += group(replacement.substr(i + 1, end - i - 1));
            i = end;
        }
        else
        {
            rv += c;
            ++i;
        }
    }

    return rv;
}

std::optional<std::u32string> kaku::expand_match(
    compiled_pattern_t const& pattern,
    document_t const& document,
    range_t const& range,
    std::optional<range_t> const& scope,
    std::u32string_view const replacement)
{
    range_t const region{search_region(document, scope)};
    if (!document.is_valid(range) || !document.is_valid(region))
    {
        return std::nullopt;
    }

    std::optional<std::u32string> rv;
    try
    {
        visit_matches(pattern,
            document,
            region,
            {},
            [&](range_t const& found, regex_match_t const& match)
            {
                if (found == range)
                {
                    rv = expand_template(match, replacement);
                    return false;
                }
                return found.start < range.start;
            });
    }
    catch (std::runtime_error const& ex)
    {
        spdlog::warn("Expanding replacement failed: {}", ex.what());
    }

    return rv;
}

std::vector<size_t> kaku::lines_with_matches(compiled_pattern_t const& pattern,
    document_t const& document,
    std::optional<range_t> const& scope,
    size_t const context_before,
    size_t const context_after)
{
    size_t const min_line{scope ? scope->start.line : 0};
    size_t const max_line{
        scope ? scope->end.line : document.line_count() - 1};

    std::vector<size_t> rv;
    for (range_t const& match : find_all(pattern, document, scope))
    {
        size_t const hit{match.start.line};
        size_t const first{
            std::max(hit - std::min(hit, context_before), min_line)};
        size_t const last{std::min(hit + context_after, max_line)};
        for (size_t line{first}; line <= last; ++line)
        {
            rv.push_back(line);
        }
    }

    std::ranges::sort(rv);
    auto const [first, last] = std::ranges::unique(rv);
    rv.erase(first, last);

    return rv;
}

void kaku::find_history_t::add(std::u32string pattern)
{
    if (pattern.empty())
    {
        return;
    }

    std::erase(entries_, pattern);
    entries_.push_front(std::move(pattern));
    if (entries_.size() > max_entries)
    {
        entries_.pop_back();
    }
}

std::deque<std::u32string> const& kaku::find_history_t::entries() const
{
    return entries_;
}

void kaku::find_state_t::set_pattern(std::u32string pattern)
{
    pattern_ = std::move(pattern);
}

void kaku::find_state_t::set_mode(pattern_mode_t const mode) { mode_ = mode; }

void kaku::find_state_t::set_case_sensitive(bool const case_sensitive)
{
    case_sensitive_ = case_sensitive;
}

void kaku::find_state_t::set_scope(std::optional<range_t> scope)
{
    scope_ = scope;
}

void kaku::find_state_t::update(document_t const& document,
    std::stop_token const& stop_token)
{
    compiled_.reset();
    error_.reset();
    matches_.clear();
    current_index_.reset();

    if (pattern_.empty())
    {
        return;
    }

    std::expected<compiled_pattern_t, pattern_error_t> compiled{
        compile(pattern_, mode_, case_sensitive_)};
    if (!compiled)
    {
        error_ = std::move(compiled.error());
        return;
    }

    compiled_ = *std::move(compiled);
    matches_ = find_all(*compiled_, document, scope_, stop_token);
}

void kaku::find_state_t::clear()
{
    pattern_.clear();
    scope_.reset();
    compiled_.reset();
    error_.reset();
    matches_.clear();
    current_index_.reset();
}

std::u32string const& kaku::find_state_t::pattern() const { return pattern_; }

kaku::pattern_mode_t kaku::find_state_t::mode() const { return mode_; }

bool kaku::find_state_t::case_sensitive() const { return case_sensitive_; }

std::optional<kaku::range_t> const& kaku::find_state_t::scope() const
{
    return scope_;
}

std::optional<kaku::compiled_pattern_t> const&
kaku::find_state_t::compiled() const
{
    return compiled_;
}

std::optional<kaku::pattern_error_t> const& kaku::find_state_t::error() const
{
    return error_;
}

std::vector<kaku::range_t> const& kaku::find_state_t::matches() const
{
    return matches_;
}

std::optional<size_t> kaku::find_state_t::current_index() const
{
    return current_index_;
}

std::optional<kaku::found_t> kaku::find_state_t::next(position_t const& from)
{
    std::optional<found_t> rv{kaku::next(matches_, from)};
    if (rv)
    {
        current_index_ = rv->index;
    }
    return rv;
}

std::optional<kaku::found_t> kaku::find_state_t::previous(
    position_t const& from)
{
    std::optional<found_t> rv{kaku::previous(matches_, from)};
    if (rv)
    {
        current_index_ = rv->index;
    }
    return rv;
}

std::pair<size_t, size_t> kaku::find_state_t::hit_count() const
{
    return {current_index_ ? *current_index_ + 1 : 0, matches_.size()};
}

kaku::edit_result_t kaku::replace_one(edit_engine_t& engine,
    document_t const& document,
    find_state_t const& state,
    std::u32string_view const replacement)
{
    std::optional<size_t> const index{state.current_index()};
    if (!state.compiled() || !index || *index >= state.matches().size())
    {
        return std::nullopt;
    }

    range_t const range{state.matches()[*index]};
    std::optional<std::u32string> const text{expand_match(*state.compiled(),
        document,
        range,
        state.scope(),
        replacement)};
    if (!text)
    {
        spdlog::debug("Current match no longer matches, nothing replaced");
        return std::nullopt;
    }

    return engine.replace_range(range, *text);
}

kaku::edit_result_t kaku::replace_all(edit_engine_t& engine,
    document_t const& document,
    find_state_t const& state,
    std::u32string_view const replacement)
{
    if (!state.compiled() || state.matches().empty())
    {
        return std::nullopt;
    }

    range_t const region{search_region(document, state.scope())};
    if (!document.is_valid(region))
    {
        return std::unexpected{make_error_code(error_t::out_of_bounds)};
    }

    std::vector<std::pair<range_t, std::u32string>> replacements;
    replacements.reserve(state.matches().size());
    try
    {
        visit_matches(*state.compiled(),
            document,
            region,
            {},
            [&replacements, replacement](range_t const& range,
                regex_match_t const& match)
            {
                replacements.emplace_back(range,
                    expand_template(match, replacement));
                return true;
            });
    }
    catch (std::runtime_error const& ex)
    {
        spdlog::warn("Replace aborted: {}", ex.what());
        return std::unexpected{make_error_code(error_t::pattern_error)};
    }

    if (replacements.empty())
    {
        return std::nullopt;
    }

    spdlog::debug("Replacing {} matches", replacements.size());

    return engine.replace_ranges(std::move(replacements));
}
