#ifndef KAKU_FIND_INCLUDED
#define KAKU_FIND_INCLUDED

#include <kaku_edit_engine.hpp>
#include <kaku_position.hpp>

#include <boost/regex.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace kaku
{
    class document_t;
} // namespace kaku

namespace kaku
{
    enum class pattern_mode_t : uint8_t
    {
        regex,
        wildcard
    };

    // Match of a pattern in wide text holding code points.
    using regex_match_t = boost::match_results<std::wstring::const_iterator>;

    struct [[nodiscard]] pattern_error_t final
    {
        std::error_code code;
        std::string message;
    };

    class [[nodiscard]] compiled_pattern_t final
    {
    public:
        compiled_pattern_t(boost::wregex regex, bool multi_line);

        compiled_pattern_t(compiled_pattern_t const&) = default;

        compiled_pattern_t(compiled_pattern_t&&) noexcept = default;

    public:
        ~compiled_pattern_t() = default;

    public:
        [[nodiscard]] boost::wregex const& regex() const;

        // Pattern names the line break explicitly and is matched against
        // the joined lines.
        [[nodiscard]] bool multi_line() const;

    public:
        compiled_pattern_t& operator=(compiled_pattern_t const&) = default;

        compiled_pattern_t& operator=(compiled_pattern_t&&) noexcept = default;

    private:
        boost::wregex regex_;
        bool multi_line_;
    };

    // '*' matches any run, '?' one character, everything else is literal.
    [[nodiscard]] std::u32string wildcard_to_regex(std::u32string_view pattern);

    [[nodiscard]] std::expected<compiled_pattern_t, pattern_error_t> compile(
        std::u32string_view pattern,
        pattern_mode_t mode,
        bool case_sensitive);

    // Non empty matches in document order. The stop token is polled between
    // lines, a stopped search returns what was found so far.
    [[nodiscard]] std::vector<range_t> find_all(
        compiled_pattern_t const& pattern,
        document_t const& document,
        std::optional<range_t> const& scope = std::nullopt,
        std::stop_token const& stop_token = {});

    struct [[nodiscard]] found_t final
    {
        range_t range;
        size_t index{};
        bool wrapped{};

        [[nodiscard]] bool operator==(found_t const&) const = default;
    };

    // First match starting after from, wrapping to the first one.
    [[nodiscard]] std::optional<found_t> next(std::span<range_t const> matches,
        position_t const& from);

    // Last match starting before from, wrapping to the last one.
    [[nodiscard]] std::optional<found_t>
    previous(std::span<range_t const> matches, position_t const& from);

    // Substitutes $n, ${n}, $name, ${name} and $$ with groups of the match.
    // Missing groups expand to nothing.
    [[nodiscard]] std::u32string expand_template(regex_match_t const& match,
        std::u32string_view replacement);

    // Expands the replacement for the match at range, as found by searching
    // the scope. Empty when the scope has no such match anymore.
    [[nodiscard]] std::optional<std::u32string> expand_match(
        compiled_pattern_t const& pattern,
        document_t const& document,
        range_t const& range,
        std::optional<range_t> const& scope,
        std::u32string_view replacement);

    // Lines holding a match with their context, clipped to the scope.
    [[nodiscard]] std::vector<size_t> lines_with_matches(
        compiled_pattern_t const& pattern,
        document_t const& document,
        std::optional<range_t> const& scope,
        size_t context_before,
        size_t context_after);

    // Most recent first, without duplicates.
    class [[nodiscard]] find_history_t final
    {
    public:
        static constexpr size_t max_entries{100};

    public:
        find_history_t() = default;

        find_history_t(find_history_t const&) = default;

        find_history_t(find_history_t&&) noexcept = default;

    public:
        ~find_history_t() = default;

    public:
        void add(std::u32string pattern);

        [[nodiscard]] std::deque<std::u32string> const& entries() const;

    public:
        find_history_t& operator=(find_history_t const&) = default;

        find_history_t& operator=(find_history_t&&) noexcept = default;

    private:
        std::deque<std::u32string> entries_;
    };

    class [[nodiscard]] find_state_t final
    {
    public:
        find_state_t() = default;

        find_state_t(find_state_t const&) = default;

        find_state_t(find_state_t&&) noexcept = default;

    public:
        ~find_state_t() = default;

    public:
        void set_pattern(std::u32string pattern);

        void set_mode(pattern_mode_t mode);

        void set_case_sensitive(bool case_sensitive);

        void set_scope(std::optional<range_t> scope);

        // Recompiles the pattern and recomputes every match. A malformed
        // pattern leaves no matches and is reported through error().
        void update(document_t const& document,
            std::stop_token const& stop_token = {});

        void clear();

        [[nodiscard]] std::u32string const& pattern() const;

        [[nodiscard]] pattern_mode_t mode() const;

        [[nodiscard]] bool case_sensitive() const;

        [[nodiscard]] std::optional<range_t> const& scope() const;

        [[nodiscard]] std::optional<compiled_pattern_t> const& compiled() const;

        [[nodiscard]] std::optional<pattern_error_t> const& error() const;

        [[nodiscard]] std::vector<range_t> const& matches() const;

        [[nodiscard]] std::optional<size_t> current_index() const;

        [[nodiscard]] std::optional<found_t> next(position_t const& from);

        [[nodiscard]] std::optional<found_t> previous(position_t const& from);

        // One based index of the current match and the number of matches.
        [[nodiscard]] std::pair<size_t, size_t> hit_count() const;

    public:
        find_state_t& operator=(find_state_t const&) = default;

        find_state_t& operator=(find_state_t&&) noexcept = default;

    private:
        std::u32string pattern_;
        pattern_mode_t mode_{pattern_mode_t::regex};
        bool case_sensitive_{false};
        std::optional<range_t> scope_;

        std::optional<compiled_pattern_t> compiled_;
        std::optional<pattern_error_t> error_;
        std::vector<range_t> matches_;
        std::optional<size_t> current_index_;
    };

    // Replaces the current match. Nothing happens without a valid pattern
    // or a current match.
    edit_result_t replace_one(edit_engine_t& engine,
        document_t const& document,
        find_state_t const& state,
        std::u32string_view replacement);

    // Replaces every match as one undo unit.
    edit_result_t replace_all(edit_engine_t& engine,
        document_t const& document,
        find_state_t const& state,
        std::u32string_view replacement);
} // namespace kaku

#endif
