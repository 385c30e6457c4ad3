#include <kaku_edit_engine.hpp>

#include <kaku_clipboard.hpp>
#include <kaku_document.hpp>
#include <kaku_error.hpp>
#include <kaku_undo_history.hpp>
#include <kaku_unicode.hpp>

#include <boost/scope/scope_exit.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <span>

namespace
{
    class [[nodiscard]] transaction_t final
    {
    public:
        explicit transaction_t(kaku::document_t& document)
            : document_{&document}
        {
        }

        transaction_t(transaction_t const&) = delete;

        transaction_t(transaction_t&&) noexcept = delete;

    public:
        ~transaction_t() = default;

    public:
        [[nodiscard]] kaku::document_t& document() { return *document_; }

        [[nodiscard]] std::expected<void, std::error_code> apply(
            kaku::edit_t edit)
        {
            if (auto result{kaku::apply(*document_, edit)}; !result)
            {
                return result;
            }

            edits_.push_back(std::move(edit));
            return {};
        }

        // Returns the position past the inserted text.
        [[nodiscard]] std::expected<kaku::position_t, std::error_code> insert(
            kaku::position_t const& position,
            std::u32string_view const text)
        {
            std::expected<void, std::error_code> result;
            if (text.empty())
            {
                return position;
            }

            if (text == U"\n")
            {
                result = apply(kaku::split_line_t{position});
            }
            else if (text.size() == 1)
            {
                result = apply(kaku::insert_char_t{position, text.front()});
            }
            else
            {
                result = apply(
                    kaku::insert_text_block_t{position, std::u32string{text}});
            }

            if (!result)
            {
                return std::unexpected{result.error()};
            }

            return kaku::end_of(position, text);
        }

        [[nodiscard]] std::expected<void, std::error_code> erase(
            kaku::range_t const& range)
        {
            std::expected<std::u32string, std::error_code> text{
                document_->text(range)};
            if (!text)
            {
                return std::unexpected{text.error()};
            }

            if (text->empty())
            {
                return {};
            }

            if (*text == U"\n")
            {
                return apply(kaku::join_line_t{range.start});
            }

            if (text->size() == 1)
            {
                return apply(
                    kaku::delete_char_after_t{range.start, text->front()});
            }

            return apply(kaku::delete_range_t{range, *std::move(text)});
        }

        [[nodiscard]] size_t size() const { return edits_.size(); }

        [[nodiscard]] std::span<kaku::edit_t const> edits_since(
            size_t const mark) const
        {
            return std::span{edits_}.subspan(mark);
        }

        void rollback()
        {
            for (auto it{edits_.crbegin()}; it != edits_.crend(); ++it)
            {
                if (auto const result{
                        kaku::apply(*document_, kaku::invert(*it))};
                    !result)
                {
                    spdlog::error("Edit rollback failed: {}",
                        result.error().message());
                }
            }
            edits_.clear();
        }

        [[nodiscard]] std::vector<kaku::edit_t> release()
        {
            return std::move(edits_);
        }

    public:
        transaction_t& operator=(transaction_t const&) = delete;

        transaction_t& operator=(transaction_t&&) noexcept = delete;

    private:
        kaku::document_t* document_;
        std::vector<kaku::edit_t> edits_;
    };

    void shift_cursors(kaku::selection_model_t& selection,
        std::span<kaku::edit_t const> const edits)
    {
        kaku::cursor_state_t state{selection.cursor_state()};
        for (kaku::edit_t const& edit : edits)
        {
            state.primary = kaku::transform(state.primary, edit);
            for (kaku::position_t& cursor : state.others)
            {
                cursor = kaku::transform(cursor, edit);
            }
        }
        selection.set_cursors(state.primary, std::move(state.others));
    }

    // Runs the function at every cursor, highest position first. The
    // function returns where its cursor ends up, cursors handled earlier are
    // shifted by the edits it made.
    template<typename Function>
    [[nodiscard]] std::expected<void, std::error_code> for_each_cursor(
        kaku::selection_model_t& selection,
        transaction_t& transaction,
        Function&& function)
    {
        std::vector<kaku::position_t> positions{selection.cursors()};
        kaku::position_t const primary{positions.front()};
        std::ranges::sort(positions, std::greater{});

        std::vector<std::pair<kaku::position_t, kaku::position_t>> moved;
        moved.reserve(positions.size());
        for (kaku::position_t const& position : positions)
        {
            size_t const mark{transaction.size()};

            std::expected<kaku::position_t, std::error_code> const result{
                function(transaction, position)};
            if (!result)
            {
                return std::unexpected{result.error()};
            }

            for (kaku::edit_t const& edit : transaction.edits_since(mark))
            {
                for (auto& [original, current] : moved)
                {
                    current = kaku::transform(current, edit);
                }
            }

            moved.emplace_back(position, *result);
        }

        kaku::position_t new_primary{primary};
        std::vector<kaku::position_t> others;
        for (auto const& [original, current] : moved)
        {
            if (original == primary)
            {
                new_primary = current;
            }
            else
            {
                others.push_back(current);
            }
        }
        selection.set_cursors(new_primary, std::move(others));

        return {};
    }

    // A block leaves one cursor per row at its start column.
    [[nodiscard]] std::expected<void, std::error_code> delete_selection(
        kaku::selection_model_t& selection,
        transaction_t& transaction)
    {
        if (std::optional<kaku::block_region_t> const block{
                selection.normalized_block()})
        {
            std::vector<kaku::range_t> const rows{
                kaku::block_row_ranges(*block, transaction.document())};
            for (auto it{rows.crbegin()}; it != rows.crend(); ++it)
            {
                if (auto const result{transaction.erase(*it)}; !result)
                {
                    return result;
                }
            }

            selection.clear_selection();
            if (rows.empty())
            {
                return {};
            }

            std::vector<kaku::position_t> others;
            std::transform(std::next(rows.cbegin()),
                rows.cend(),
                std::back_inserter(others),
                [](kaku::range_t const& row) { return row.start; });
            selection.set_cursors(rows.front().start, std::move(others));
            return {};
        }

        if (std::optional<kaku::range_t> const range{
                selection.normalized_range()})
        {
            if (auto const result{transaction.erase(*range)}; !result)
            {
                return result;
            }
            selection.navigate(range->start);
        }

        return {};
    }

    // Leaves plain cursors ready for typing.
    [[nodiscard]] std::expected<void, std::error_code> prepare_cursors(
        kaku::selection_model_t& selection,
        transaction_t& transaction)
    {
        if (selection.cursors_from_zero_width_block(transaction.document()))
        {
            return {};
        }

        if (selection.has_selection())
        {
            return delete_selection(selection, transaction);
        }

        selection.clear_selection();
        return {};
    }

    [[nodiscard]] std::expected<kaku::position_t, std::error_code>
    delete_before(transaction_t& transaction, kaku::position_t const& position)
    {
        kaku::document_t const& document{transaction.document()};

        if (position.col > 0)
        {
            kaku::position_t const previous{position.line, position.col - 1};
            std::expected<char32_t, std::error_code> const character{
                document.char_at(previous)};
            if (!character)
            {
                return std::unexpected{character.error()};
            }

            if (auto const result{transaction.apply(
                    kaku::delete_char_before_t{position, *character})};
                !result)
            {
                return std::unexpected{result.error()};
            }
            return previous;
        }

        if (position.line == 0)
        {
            return position;
        }

        kaku::position_t const joint{position.line - 1,
            document.line_length(position.line - 1)};
        if (auto const result{transaction.apply(kaku::join_line_t{joint})};
            !result)
        {
            return std::unexpected{result.error()};
        }
        return joint;
    }

    [[nodiscard]] std::expected<kaku::position_t, std::error_code>
    delete_after(transaction_t& transaction, kaku::position_t const& position)
    {
        kaku::document_t const& document{transaction.document()};

        std::expected<void, std::error_code> result;
        if (position.col < document.line_length(position.line))
        {
            std::expected<char32_t, std::error_code> const character{
                document.char_at(position)};
            if (!character)
            {
                return std::unexpected{character.error()};
            }
            result = transaction.apply(
                kaku::delete_char_after_t{position, *character});
        }
        else if (position.line + 1 < document.line_count())
        {
            result = transaction.apply(kaku::join_line_t{position});
        }

        if (!result)
        {
            return std::unexpected{result.error()};
        }
        return position;
    }

    [[nodiscard]] size_t word_start(std::u32string_view const line,
        size_t col)
    {
        while (col > 0 && !kaku::is_word_char(line[col - 1]))
        {
            --col;
        }
        while (col > 0 && kaku::is_word_char(line[col - 1]))
        {
            --col;
        }
        return col;
    }

    [[nodiscard]] size_t word_end(std::u32string_view const line, size_t col)
    {
        while (col < line.size() && !kaku::is_word_char(line[col]))
        {
            ++col;
        }
        while (col < line.size() && kaku::is_word_char(line[col]))
        {
            ++col;
        }
        return col;
    }

    [[nodiscard]] std::error_code out_of_bounds()
    {
        return make_error_code(kaku::error_t::out_of_bounds);
    }
} // namespace

kaku::edit_engine_t::edit_engine_t(document_t& document,
    selection_model_t& selection,
    undo_history_t& history,
    clipboard_t& clipboard)
    : document_{&document}
    , selection_{&selection}
    , history_{&history}
    , clipboard_{&clipboard}
{
}

void kaku::edit_engine_t::set_history_listener(history_listener_t listener)
{
    listener_ = std::move(listener);
}

template<typename Function>
kaku::edit_result_t kaku::edit_engine_t::run(Function&& function)
{
    selection_->clamp(*document_);
    selection_model_t const saved_selection{*selection_};

    transaction_t transaction{*document_};
    boost::scope::scope_exit rollback{
        [this, &transaction, &saved_selection]()
        {
            transaction.rollback();
            *selection_ = saved_selection;
        }};

    if (std::expected<void, std::error_code> const result{
            std::forward<Function>(function)(transaction)};
        !result)
    {
        spdlog::debug("Edit rolled back: {}", result.error().message());
        return std::unexpected{result.error()};
    }

    rollback.set_active(false);

    return commit(transaction.release(), saved_selection.cursor_state());
}

kaku::edit_result_t kaku::edit_engine_t::insert_text(
    std::u32string_view const text)
{
    if (text.empty())
    {
        return std::nullopt;
    }

    return run(
        [this, text](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (auto const result{prepare_cursors(*selection_, transaction)};
                !result)
            {
                return result;
            }

            return for_each_cursor(*selection_,
                transaction,
                [text](transaction_t& t, position_t const& position)
                { return t.insert(position, text); });
        });
}

kaku::edit_result_t kaku::edit_engine_t::delete_backward()
{
    return run(
        [this](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (!selection_->cursors_from_zero_width_block(*document_))
            {
                if (selection_->has_selection())
                {
                    return delete_selection(*selection_, transaction);
                }
                selection_->clear_selection();
            }

            return for_each_cursor(*selection_, transaction, delete_before);
        });
}

kaku::edit_result_t kaku::edit_engine_t::delete_forward()
{
    return run(
        [this](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (!selection_->cursors_from_zero_width_block(*document_))
            {
                if (selection_->has_selection())
                {
                    return delete_selection(*selection_, transaction);
                }
                selection_->clear_selection();
            }

            return for_each_cursor(*selection_, transaction, delete_after);
        });
}

kaku::edit_result_t kaku::edit_engine_t::split_line(
    position_t const& position)
{
    if (!document_->is_valid(position))
    {
        return std::unexpected{out_of_bounds()};
    }

    return run(
        [this, position](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            selection_->clear_selection();
            if (auto const result{transaction.apply(split_line_t{position})};
                !result)
            {
                return result;
            }
            shift_cursors(*selection_, transaction.edits_since(0));
            return {};
        });
}

kaku::edit_result_t kaku::edit_engine_t::split_line()
{
    return insert_text(U"\n");
}

kaku::edit_result_t kaku::edit_engine_t::join_line(size_t const line_index)
{
    if (line_index + 1 >= document_->line_count())
    {
        return std::unexpected{out_of_bounds()};
    }

    return run(
        [this, line_index](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            selection_->clear_selection();
            if (auto const result{transaction.apply(join_line_t{
                    {line_index, document_->line_length(line_index)}})};
                !result)
            {
                return result;
            }
            shift_cursors(*selection_, transaction.edits_since(0));
            return {};
        });
}

kaku::edit_result_t kaku::edit_engine_t::insert_tab(size_t const tab_width)
{
    return insert_text(std::u32string(tab_width, U' '));
}

kaku::edit_result_t kaku::edit_engine_t::delete_word_backward()
{
    return run(
        [this](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (selection_->has_selection())
            {
                return delete_selection(*selection_, transaction);
            }
            selection_->clear_selection();

            return for_each_cursor(*selection_,
                transaction,
                [](transaction_t& t, position_t const& position)
                    -> std::expected<position_t, std::error_code>
                {
                    if (position.col == 0)
                    {
                        return delete_before(t, position);
                    }

                    position_t const start{position.line,
                        word_start(t.document()[position.line], position.col)};
                    if (auto const result{t.erase({start, position})};
                        !result)
                    {
                        return std::unexpected{result.error()};
                    }
                    return start;
                });
        });
}

kaku::edit_result_t kaku::edit_engine_t::delete_word_forward()
{
    return run(
        [this](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (selection_->has_selection())
            {
                return delete_selection(*selection_, transaction);
            }
            selection_->clear_selection();

            return for_each_cursor(*selection_,
                transaction,
                [](transaction_t& t, position_t const& position)
                    -> std::expected<position_t, std::error_code>
                {
                    std::u32string_view const line{
                        t.document()[position.line]};
                    if (position.col == line.size())
                    {
                        return delete_after(t, position);
                    }

                    position_t const end{position.line,
                        word_end(line, position.col)};
                    if (auto const result{t.erase({position, end})}; !result)
                    {
                        return std::unexpected{result.error()};
                    }
                    return position;
                });
        });
}

bool kaku::edit_engine_t::copy()
{
    selection_->clamp(*document_);
    if (!selection_->has_selection())
    {
        return false;
    }

    clipboard_->set_text(selection_->selection_text(*document_));
    return true;
}

kaku::edit_result_t kaku::edit_engine_t::cut()
{
    if (!copy())
    {
        return std::nullopt;
    }

    return run([this](transaction_t& transaction)
        { return delete_selection(*selection_, transaction); });
}

kaku::edit_result_t kaku::edit_engine_t::paste()
{
    std::u32string const text{clipboard_->get_text()};
    if (text.empty())
    {
        return std::nullopt;
    }

    return run(
        [this, &text](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (auto const result{prepare_cursors(*selection_, transaction)};
                !result)
            {
                return result;
            }

            std::vector<std::u32string_view> lines{split_lines(text)};
            if (lines.size() > 1 && lines.back().empty())
            {
                lines.pop_back();
            }

            std::vector<position_t> order{selection_->cursors()};
            if (order.size() == 1 || lines.size() != order.size())
            {
                return for_each_cursor(*selection_,
                    transaction,
                    [&text](transaction_t& t, position_t const& position)
                    { return t.insert(position, text); });
            }

            std::ranges::sort(order);
            return for_each_cursor(*selection_,
                transaction,
                [&order, &lines](transaction_t& t, position_t const& position)
                {
                    auto const index{static_cast<size_t>(std::distance(
                        order.begin(),
                        std::ranges::lower_bound(order, position)))};
                    return t.insert(position, lines[index]);
                });
        });
}

kaku::edit_result_t kaku::edit_engine_t::replace_range(range_t const& range,
    std::u32string_view const text)
{
    if (!document_->is_valid(range))
    {
        return std::unexpected{out_of_bounds()};
    }

    return run(
        [this, &range, text](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            if (auto const result{transaction.erase(range)}; !result)
            {
                return result;
            }

            std::expected<position_t, std::error_code> const end{
                transaction.insert(range.start, text)};
            if (!end)
            {
                return std::unexpected{end.error()};
            }

            selection_->navigate(*end);
            return {};
        });
}

kaku::edit_result_t kaku::edit_engine_t::replace_ranges(
    std::vector<std::pair<range_t, std::u32string>> replacements)
{
    std::ranges::sort(replacements,
        std::greater{},
        [](auto const& replacement) { return replacement.first.start; });

    for (size_t i{}; i != replacements.size(); ++i)
    {
        range_t const& range{replacements[i].first};
        if (!document_->is_valid(range) ||
            (i != 0 && replacements[i - 1].first.start < range.end))
        {
            return std::unexpected{out_of_bounds()};
        }
    }

    return run(
        [this, &replacements](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            selection_->clear_selection();
            for (auto const& [range, text] : replacements)
            {
                if (auto const result{transaction.erase(range)}; !result)
                {
                    return result;
                }

                if (auto const result{transaction.insert(range.start, text)};
                    !result)
                {
                    return std::unexpected{result.error()};
                }
            }
            shift_cursors(*selection_, transaction.edits_since(0));
            return {};
        });
}

kaku::edit_result_t kaku::edit_engine_t::move_block(range_t const& source,
    position_t const& destination,
    bool const copy)
{
    if (!document_->is_valid(source) || !document_->is_valid(destination))
    {
        return std::unexpected{out_of_bounds()};
    }

    if (source.empty() ||
        (source.start < destination && destination < source.end))
    {
        return std::nullopt;
    }

    std::expected<std::u32string, std::error_code> const text{
        document_->text(source)};
    if (!text)
    {
        return std::unexpected{text.error()};
    }

    return run(
        [&, this](transaction_t& transaction)
            -> std::expected<void, std::error_code>
        {
            position_t start{destination};
            position_t end;

            if (copy || destination >= source.end)
            {
                std::expected<position_t, std::error_code> const inserted{
                    transaction.insert(destination, *text)};
                if (!inserted)
                {
                    return std::unexpected{inserted.error()};
                }
                end = *inserted;

                if (!copy)
                {
                    size_t const mark{transaction.size()};
                    if (auto const result{transaction.erase(source)}; !result)
                    {
                        return result;
                    }
                    for (edit_t const& edit : transaction.edits_since(mark))
                    {
                        start = transform(start, edit);
                        end = transform(end, edit);
                    }
                }
            }
            else
            {
                if (auto const result{transaction.erase(source)}; !result)
                {
                    return result;
                }

                std::expected<position_t, std::error_code> const inserted{
                    transaction.insert(destination, *text)};
                if (!inserted)
                {
                    return std::unexpected{inserted.error()};
                }
                end = *inserted;
            }

            selection_->start_selection(start, selection_kind_t::line);
            selection_->extend_selection(end);
            return {};
        });
}

std::expected<void, std::error_code> kaku::edit_engine_t::apply_undo(
    history_entry_t const& entry)
{
    transaction_t transaction{*document_};
    boost::scope::scope_exit rollback{[&transaction]()
        { transaction.rollback(); }};

    for (auto it{entry.edits.crbegin()}; it != entry.edits.crend(); ++it)
    {
        if (auto const result{transaction.apply(invert(*it))}; !result)
        {
            spdlog::warn("Undo failed: {}", result.error().message());
            return result;
        }
    }

    rollback.set_active(false);
    selection_->restore(entry.before);
    return {};
}

std::expected<void, std::error_code> kaku::edit_engine_t::apply_redo(
    history_entry_t const& entry)
{
    transaction_t transaction{*document_};
    boost::scope::scope_exit rollback{[&transaction]()
        { transaction.rollback(); }};

    for (edit_t const& edit : entry.edits)
    {
        if (auto const result{transaction.apply(edit)}; !result)
        {
            spdlog::warn("Redo failed: {}", result.error().message());
            return result;
        }
    }

    rollback.set_active(false);
    selection_->restore(entry.after);
    return {};
}

kaku::edit_result_t kaku::edit_engine_t::undo()
{
    if (!history_->can_undo())
    {
        return std::nullopt;
    }

    if (auto const result{
            apply_undo(history_->entries()[history_->current() - 1])};
        !result)
    {
        return std::unexpected{result.error()};
    }

    std::optional<history_entry_t> rv{history_->undo()};
    if (rv)
    {
        notify(history_event_kind_t::undo, *rv, 0);
    }
    return rv;
}

kaku::edit_result_t kaku::edit_engine_t::redo()
{
    if (!history_->can_redo())
    {
        return std::nullopt;
    }

    if (auto const result{apply_redo(history_->entries()[history_->current()])};
        !result)
    {
        return std::unexpected{result.error()};
    }

    std::optional<history_entry_t> rv{history_->redo()};
    if (rv)
    {
        notify(history_event_kind_t::redo, *rv, 0);
    }
    return rv;
}

kaku::edit_result_t kaku::edit_engine_t::commit(std::vector<edit_t> edits,
    cursor_state_t const& before)
{
    if (edits.empty())
    {
        return std::nullopt;
    }

    history_entry_t entry{std::move(edits),
        before,
        selection_->cursor_state()};

    size_t const evicted{history_->push(entry)};
    notify(history_event_kind_t::push, entry, evicted);

    return entry;
}

void kaku::edit_engine_t::notify(history_event_kind_t const kind,
    history_entry_t const& entry,
    size_t const evicted) const
{
    if (listener_)
    {
        listener_({kind, &entry, evicted});
    }
}
