#include <kaku_undo_history.hpp>

#include <kaku_error.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

kaku::undo_history_t::undo_history_t(history_limits_t const& limits)
    : limits_{limits}
{
}

size_t kaku::undo_history_t::push(history_entry_t entry)
{
    while (entries_.size() > current_)
    {
        bytes_ -= content_size(entries_.back());
        entries_.pop_back();
    }

    if (saved_at_ && *saved_at_ > current_)
    {
        saved_at_.reset();
    }

    bytes_ += content_size(entry);
    entries_.push_back(std::move(entry));
    current_ = entries_.size();

    return evict();
}

std::optional<kaku::history_entry_t> kaku::undo_history_t::undo()
{
    if (!can_undo())
    {
        return std::nullopt;
    }

    --current_;
    return entries_[current_];
}

std::optional<kaku::history_entry_t> kaku::undo_history_t::redo()
{
    if (!can_redo())
    {
        return std::nullopt;
    }

    return entries_[current_++];
}

bool kaku::undo_history_t::can_undo() const { return current_ > 0; }

bool kaku::undo_history_t::can_redo() const
{
    return current_ < entries_.size();
}

void kaku::undo_history_t::mark_saved() { saved_at_ = current_; }

bool kaku::undo_history_t::modified() const { return saved_at_ != current_; }

std::deque<kaku::history_entry_t> const&
kaku::undo_history_t::entries() const
{
    return entries_;
}

size_t kaku::undo_history_t::current() const { return current_; }

std::optional<size_t> kaku::undo_history_t::saved_at() const
{
    return saved_at_;
}

size_t kaku::undo_history_t::content_bytes() const { return bytes_; }

kaku::history_limits_t const& kaku::undo_history_t::limits() const
{
    return limits_;
}

std::expected<void, std::error_code> kaku::undo_history_t::restore(
    std::vector<history_entry_t> entries,
    size_t const current,
    std::optional<size_t> const saved_at)
{
    if (current > entries.size() || (saved_at && *saved_at > entries.size()))
    {
        return std::unexpected{make_error_code(error_t::persistence_error)};
    }

    entries_.assign(std::make_move_iterator(entries.begin()),
        std::make_move_iterator(entries.end()));
    current_ = current;
    saved_at_ = saved_at;

    bytes_ = 0;
    for (history_entry_t const& entry : entries_)
    {
        bytes_ += content_size(entry);
    }

    evict();

    return {};
}

void kaku::undo_history_t::clear()
{
    entries_.clear();
    current_ = 0;
    saved_at_ = 0;
    bytes_ = 0;
}

size_t kaku::undo_history_t::evict()
{
    size_t rv{};
    while (entries_.size() > 1 &&
        (entries_.size() > limits_.max_entries || bytes_ > limits_.max_bytes))
    {
        if (current_ == 0)
        {
            // Only redo entries are left, none can be kept without the
            // oldest one.
            rv += entries_.size();
            entries_.clear();
            bytes_ = 0;
            if (saved_at_ != 0)
            {
                saved_at_.reset();
            }
            break;
        }

        bytes_ -= content_size(entries_.front());
        entries_.pop_front();
        --current_;
        ++rv;

        if (saved_at_ == 0)
        {
            saved_at_.reset();
        }
        else if (saved_at_)
        {
            --*saved_at_;
        }
    }

    if (rv != 0)
    {
        spdlog::debug("Evicted {} undo entries, {} remain using {} bytes",
            rv,
            entries_.size(),
            bytes_);
    }

    return rv;
}
