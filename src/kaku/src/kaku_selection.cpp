#include <kaku_selection.hpp>

#include <kaku_document.hpp>

#include <cppext_overloaded.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

kaku::block_region_t kaku::normalize(block_selection_t const& block)
{
    auto const [first_line, last_line] =
        std::minmax(block.anchor.line, block.active.line);
    auto const [start_col, end_col] =
        std::minmax(block.anchor.col, block.active.col);

    return {first_line, last_line, start_col, end_col};
}

std::vector<kaku::range_t> kaku::block_row_ranges(block_region_t const& region,
    document_t const& document)
{
    std::vector<range_t> rv;

    size_t const last_line{
        std::min(region.last_line, document.line_count() - 1)};
    for (size_t line{region.first_line}; line <= last_line; ++line)
    {
        size_t const length{document.line_length(line)};
        rv.push_back({{line, std::min(region.start_col, length)},
            {line, std::min(region.end_col, length)}});
    }

    return rv;
}

std::vector<std::u32string> kaku::extract_text(selection_t const& selection,
    document_t const& document)
{
    return std::visit(
        cppext::overloaded{
            [](no_selection_t const&) { return std::vector<std::u32string>{}; },
            [&document](line_selection_t const& s)
            {
                range_t const range{make_range(document.clamp(s.anchor),
                    document.clamp(s.active))};
                return std::vector<std::u32string>{
                    document.text(range).value_or(U"")};
            },
            [&document](block_selection_t const& s)
            {
                std::vector<std::u32string> rv;
                for (range_t const& row :
                    block_row_ranges(normalize(s), document))
                {
                    rv.push_back(std::u32string{document[row.start.line].substr(
                        row.start.col,
                        row.end.col - row.start.col)});
                }
                return rv;
            }},
        selection);
}

void kaku::selection_model_t::start_selection(position_t const& position,
    selection_kind_t const kind)
{
    if (kind == selection_kind_t::block)
    {
        selection_ = block_selection_t{position, position};
    }
    else
    {
        selection_ = line_selection_t{position, position};
    }

    primary_ = position;
    others_.clear();
}

void kaku::selection_model_t::extend_selection(position_t const& position)
{
    std::visit(cppext::overloaded{[this, &position](no_selection_t const&)
                   { selection_ = line_selection_t{primary_, position}; },
                   [&position](line_selection_t& s) { s.active = position; },
                   [&position](block_selection_t& s)
                   { s.active = position; }},
        selection_);

    primary_ = position;
    others_.clear();
}

void kaku::selection_model_t::clear_selection()
{
    selection_ = no_selection_t{};
}

kaku::selection_t const& kaku::selection_model_t::selection() const
{
    return selection_;
}

bool kaku::selection_model_t::has_selection() const
{
    return std::visit(
        cppext::overloaded{[](no_selection_t const&) { return false; },
            [](line_selection_t const& s) { return s.anchor != s.active; },
            [](block_selection_t const& s)
            { return s.anchor.col != s.active.col; }},
        selection_);
}

bool kaku::selection_model_t::has_zero_width_block() const
{
    auto const* const block{std::get_if<block_selection_t>(&selection_)};
    return block && block->anchor.col == block->active.col;
}

std::optional<kaku::range_t> kaku::selection_model_t::normalized_range() const
{
    if (auto const* const s{std::get_if<line_selection_t>(&selection_)})
    {
        return make_range(s->anchor, s->active);
    }
    return std::nullopt;
}

std::optional<kaku::block_region_t>
kaku::selection_model_t::normalized_block() const
{
    if (auto const* const s{std::get_if<block_selection_t>(&selection_)})
    {
        return normalize(*s);
    }
    return std::nullopt;
}

bool kaku::selection_model_t::add_cursor_above(document_t const& document)
{
    std::vector<position_t> const all{cursors()};
    position_t const top{*std::ranges::min_element(all)};
    if (top.line == 0)
    {
        return false;
    }

    position_t const added{top.line - 1,
        std::min(top.col, document.line_length(top.line - 1))};
    if (std::ranges::contains(all, added))
    {
        return false;
    }

    others_.push_back(added);
    merge_duplicates();
    return true;
}

bool kaku::selection_model_t::add_cursor_below(document_t const& document)
{
    std::vector<position_t> const all{cursors()};
    position_t const bottom{*std::ranges::max_element(all)};
    if (bottom.line + 1 >= document.line_count())
    {
        return false;
    }

    position_t const added{bottom.line + 1,
        std::min(bottom.col, document.line_length(bottom.line + 1))};
    if (std::ranges::contains(all, added))
    {
        return false;
    }

    others_.push_back(added);
    merge_duplicates();
    return true;
}

std::vector<kaku::position_t> kaku::selection_model_t::cursors() const
{
    std::vector<position_t> rv;
    rv.reserve(others_.size() + 1);
    rv.push_back(primary_);
    rv.insert(rv.end(), others_.cbegin(), others_.cend());
    return rv;
}

kaku::position_t kaku::selection_model_t::primary() const { return primary_; }

void kaku::selection_model_t::set_primary(position_t const& position)
{
    primary_ = position;
    merge_duplicates();
}

void kaku::selection_model_t::set_cursors(position_t const& primary,
    std::vector<position_t> others)
{
    primary_ = primary;
    others_ = std::move(others);
    merge_duplicates();
}

void kaku::selection_model_t::merge_duplicates()
{
    std::ranges::sort(others_);
    auto const [first, last] = std::ranges::unique(others_);
    others_.erase(first, last);
    std::erase(others_, primary_);
}

bool kaku::selection_model_t::has_multi_cursors() const
{
    return !others_.empty();
}

void kaku::selection_model_t::navigate(position_t const& position)
{
    selection_ = no_selection_t{};
    primary_ = position;
    others_.clear();
}

bool kaku::selection_model_t::cursors_from_zero_width_block(
    document_t const& document)
{
    if (!has_zero_width_block())
    {
        return false;
    }

    std::vector<range_t> const rows{
        block_row_ranges(*normalized_block(), document)};
    if (rows.empty())
    {
        return false;
    }

    selection_ = no_selection_t{};
    primary_ = rows.front().start;
    others_.clear();
    for (auto it{std::next(rows.cbegin())}; it != rows.cend(); ++it)
    {
        others_.push_back(it->start);
    }
    merge_duplicates();

    return true;
}

kaku::cursor_state_t kaku::selection_model_t::cursor_state() const
{
    return {primary_, others_};
}

void kaku::selection_model_t::restore(cursor_state_t const& state)
{
    selection_ = no_selection_t{};
    set_cursors(state.primary, state.others);
}

void kaku::selection_model_t::clamp(document_t const& document)
{
    primary_ = document.clamp(primary_);
    for (position_t& cursor : others_)
    {
        cursor = document.clamp(cursor);
    }

    // Block columns may lie past the end of short rows.
    size_t const last_line{document.line_count() - 1};
    std::visit(cppext::overloaded{[](no_selection_t&) {},
                   [&document](line_selection_t& s)
                   {
                       s.anchor = document.clamp(s.anchor);
                       s.active = document.clamp(s.active);
                   },
                   [last_line](block_selection_t& s)
                   {
                       s.anchor.line = std::min(s.anchor.line, last_line);
                       s.active.line = std::min(s.active.line, last_line);
                   }},
        selection_);

    merge_duplicates();
}

std::vector<std::u32string> kaku::selection_model_t::extract_text(
    document_t const& document) const
{
    if (std::holds_alternative<no_selection_t>(selection_))
    {
        return std::vector<std::u32string>(others_.size() + 1);
    }

    return kaku::extract_text(selection_, document);
}

std::u32string kaku::selection_model_t::selection_text(
    document_t const& document) const
{
    std::u32string rv;

    std::vector<std::u32string> const parts{kaku::extract_text(selection_,
        document)};
    for (size_t i{}; i != parts.size(); ++i)
    {
        if (i != 0)
        {
            rv += U'\n';
        }
        rv += parts[i];
    }

    return rv;
}
