#include <kaku_document.hpp>

#include <kaku_error.hpp>

#include <algorithm>
#include <cassert>
#include <iterator>
#include <utility>

std::vector<std::u32string_view> kaku::split_lines(
    std::u32string_view const text)
{
    std::vector<std::u32string_view> rv;

    size_t start{};
    for (size_t i{}; i != text.size(); ++i)
    {
        if (text[i] == U'\n')
        {
            rv.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    rv.push_back(text.substr(start));

    return rv;
}

size_t kaku::count_lines(std::u32string_view const text)
{
    return static_cast<size_t>(std::ranges::count(text, U'\n')) + 1;
}

kaku::document_t::document_t() { lines_.push_back({{}, next_revision()}); }

kaku::document_t::document_t(std::u32string_view const text)
{
    set_text(text);
}

std::expected<kaku::position_t, std::error_code>
kaku::document_t::insert(position_t const& position,
    std::u32string_view const text)
{
    if (!is_valid(position))
    {
        return std::unexpected{make_error_code(error_t::out_of_bounds)};
    }

    std::vector<std::u32string_view> const parts{split_lines(text)};

    line_t& first{lines_[position.line]};
    if (parts.size() == 1)
    {
        first.text.insert(position.col, text);
        first.revision = next_revision();
        return position_t{position.line, position.col + text.size()};
    }

    std::u32string tail{first.text.substr(position.col)};
    first.text.erase(position.col);
    first.text += parts.front();
    first.revision = next_revision();

    std::vector<line_t> inserted;
    inserted.reserve(parts.size() - 1);
    for (auto it{std::next(parts.cbegin())}; it != parts.cend(); ++it)
    {
        inserted.push_back({std::u32string{*it}, next_revision()});
    }

    size_t const end_col{inserted.back().text.size()};
    inserted.back().text += tail;

    lines_.insert(std::next(lines_.begin(),
                      static_cast<std::ptrdiff_t>(position.line + 1)),
        std::make_move_iterator(inserted.begin()),
        std::make_move_iterator(inserted.end()));

    return position_t{position.line + parts.size() - 1, end_col};
}

std::expected<std::u32string, std::error_code> kaku::document_t::erase(
    range_t const& range)
{
    auto removed{text(range)};
    if (!removed)
    {
        return removed;
    }

    line_t& first{lines_[range.start.line]};
    if (range.start.line == range.end.line)
    {
        first.text.erase(range.start.col, range.end.col - range.start.col);
    }
    else
    {
        std::u32string_view const last{lines_[range.end.line].text};
        first.text.erase(range.start.col);
        first.text += last.substr(range.end.col);

        auto const begin{std::next(lines_.begin(),
            static_cast<std::ptrdiff_t>(range.start.line + 1))};
        auto const end{std::next(lines_.begin(),
            static_cast<std::ptrdiff_t>(range.end.line + 1))};
        lines_.erase(begin, end);
    }

    lines_[range.start.line].revision = next_revision();

    return removed;
}

std::expected<std::u32string_view, std::error_code> kaku::document_t::line(
    size_t const index) const
{
    if (index >= lines_.size())
    {
        return std::unexpected{make_error_code(error_t::out_of_bounds)};
    }

    return lines_[index].text;
}

size_t kaku::document_t::line_count() const { return lines_.size(); }

size_t kaku::document_t::line_length(size_t const index) const
{
    assert(index < lines_.size());
    return lines_[index].text.size();
}

std::expected<char32_t, std::error_code> kaku::document_t::char_at(
    position_t const& position) const
{
    if (!is_valid(position))
    {
        return std::unexpected{make_error_code(error_t::out_of_bounds)};
    }

    std::u32string const& line{lines_[position.line].text};
    if (position.col < line.size())
    {
        return line[position.col];
    }

    if (position.line + 1 < lines_.size())
    {
        return U'\n';
    }

    return std::unexpected{make_error_code(error_t::out_of_bounds)};
}

std::expected<std::u32string, std::error_code> kaku::document_t::text(
    range_t const& range) const
{
    if (!is_valid(range))
    {
        return std::unexpected{make_error_code(error_t::out_of_bounds)};
    }

    if (range.start.line == range.end.line)
    {
        return lines_[range.start.line].text.substr(range.start.col,
            range.end.col - range.start.col);
    }

    std::u32string rv{lines_[range.start.line].text.substr(range.start.col)};
    for (size_t i{range.start.line + 1}; i != range.end.line; ++i)
    {
        rv += U'\n';
        rv += lines_[i].text;
    }
    rv += U'\n';
    rv += std::u32string_view{lines_[range.end.line].text}.substr(0,
        range.end.col);

    return rv;
}

std::u32string kaku::document_t::text() const
{
    std::u32string rv;
    for (size_t i{}; i != lines_.size(); ++i)
    {
        if (i != 0)
        {
            rv += U'\n';
        }
        rv += lines_[i].text;
    }
    return rv;
}

void kaku::document_t::set_text(std::u32string_view const text)
{
    std::u32string normalized;
    normalized.reserve(text.size());
    for (size_t i{}; i != text.size(); ++i)
    {
        if (text[i] == U'\r')
        {
            normalized += U'\n';
            if (i + 1 != text.size() && text[i + 1] == U'\n')
            {
                ++i;
            }
        }
        else
        {
            normalized += text[i];
        }
    }

    lines_.clear();
    for (std::u32string_view const part : split_lines(normalized))
    {
        lines_.push_back({std::u32string{part}, next_revision()});
    }
}

uint64_t kaku::document_t::line_revision(size_t const index) const
{
    assert(index < lines_.size());
    return lines_[index].revision;
}

bool kaku::document_t::is_valid(position_t const& position) const
{
    return position.line < lines_.size() &&
        position.col <= lines_[position.line].text.size();
}

bool kaku::document_t::is_valid(range_t const& range) const
{
    return range.start <= range.end &&
        is_valid(range.start) &&
        is_valid(range.end);
}

kaku::position_t kaku::document_t::clamp(position_t const& position) const
{
    size_t const line{std::min(position.line, lines_.size() - 1)};
    return {line, std::min(position.col, lines_[line].text.size())};
}

kaku::position_t kaku::document_t::end() const
{
    return {lines_.size() - 1, lines_.back().text.size()};
}

size_t kaku::document_t::size() const
{
    size_t rv{lines_.size() - 1};
    for (line_t const& line : lines_)
    {
        rv += line.text.size();
    }
    return rv;
}

std::u32string_view kaku::document_t::operator[](size_t const index) const
{
    assert(index < lines_.size());
    return lines_[index].text;
}

uint64_t kaku::document_t::next_revision() { return ++revision_counter_; }
