#include <kaku_session.hpp>

#include <kaku_error.hpp>
#include <kaku_file.hpp>
#include <kaku_unicode.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace
{
    [[nodiscard]] kaku::loaded_history_t empty_history(
        kaku::history_limits_t const& limits)
    {
        return {kaku::undo_history_t{limits}, std::nullopt, {}, std::nullopt};
    }

    // The file on disk holds the saved state, so the history is moved
    // there. Unsaved entries stay available for redo.
    [[nodiscard]] bool align_to_saved(kaku::undo_history_t& history)
    {
        if (!history.modified())
        {
            return true;
        }

        std::optional<size_t> const saved_at{history.saved_at()};
        if (!saved_at)
        {
            return false;
        }

        std::vector<kaku::history_entry_t> entries{history.entries().cbegin(),
            history.entries().cend()};
        return history.restore(std::move(entries), *saved_at, saved_at)
            .has_value();
    }
} // namespace

kaku::session_t::session_t(config_t config, clipboard_t& clipboard)
    : config_{std::move(config)}
    , history_{config_.history_limits}
    , engine_{document_, selection_, history_, clipboard}
{
    find_.set_case_sensitive(config_.case_sensitive);
    engine_.set_history_listener([this](history_event_t const& event)
        { on_history_event(event); });
}

kaku::session_t::~session_t()
{
    if (store_)
    {
        write_log(cursor_record(view_), false);
    }
    log_writer_.drain();
}

std::expected<void, std::error_code> kaku::session_t::open(
    std::filesystem::path path,
    std::shared_ptr<history_store_t> store)
{
    log_writer_.drain();

    document_t document;
    std::string content;
    if (std::expected<std::string, std::error_code> read{read_file(path)})
    {
        content = *std::move(read);
        std::expected<std::u32string, std::error_code> const text{
            to_utf32(content)};
        if (!text)
        {
            spdlog::error("{} is not valid UTF-8", path.string());
            return std::unexpected{text.error()};
        }
        document.set_text(*text);
    }
    else if (read.error() == std::errc::no_such_file_or_directory)
    {
        spdlog::info("{} does not exist, starting with an empty document",
            path.string());
    }
    else
    {
        return std::unexpected{read.error()};
    }

    if (!store && config_.persist_history)
    {
        store = std::make_shared<file_history_store_t>(
            file_history_store_t::path_for(config_.history_root, path));
    }

    std::optional<int64_t> const timestamp{file_timestamp(path)};
    content_digest_t const digest{content_digest(content)};

    loaded_history_t loaded{store
            ? load_history(*store, config_.history_limits)
            : empty_history(config_.history_limits)};

    validation_result_t const validation{
        validate(loaded, timestamp, digest)};
    if (validation != validation_result_t::valid)
    {
        spdlog::warn("{} changed on disk, discarding its undo history",
            path.string());
        loaded = empty_history(config_.history_limits);
    }
    else if (!align_to_saved(loaded.history))
    {
        spdlog::warn("Saved state of {} is no longer in its undo history",
            path.string());
        loaded = empty_history(config_.history_limits);
    }

    document_ = std::move(document);
    history_ = std::move(loaded.history);
    selection_ = selection_model_t{};
    selection_.navigate(document_.clamp(loaded.view.cursor));
    view_ = {std::min(loaded.view.top_line, document_.line_count() - 1),
        selection_.primary()};
    mapper_.clear();
    find_.update(document_);

    path_ = std::move(path);
    file_timestamp_ = timestamp;
    file_digest_ = digest;
    validation_ = validation;
    store_ = std::move(store);

    spdlog::debug("Opened {} with {} lines and {} undo entries",
        path_.string(),
        document_.line_count(),
        history_.entries().size());

    if (store_)
    {
        compact_history();
    }

    return {};
}

std::expected<void, std::error_code> kaku::session_t::save()
{
    if (path_.empty())
    {
        spdlog::error("No file to save to");
        return std::unexpected{make_error_code(error_t::io_error)};
    }

    std::string const content{to_utf8(document_.text())};
    if (auto const result{write_file(path_, content)}; !result)
    {
        return result;
    }

    history_.mark_saved();
    file_timestamp_ = file_timestamp(path_);
    file_digest_ = content_digest(content);

    spdlog::info("Saved {}", path_.string());

    if (store_)
    {
        compact_history();
    }

    return {};
}

std::shared_future<std::expected<void, std::error_code>>
kaku::session_t::compact_history()
{
    if (!store_)
    {
        return {};
    }

    evicted_since_compaction_ = 0;
    return write_log(
        snapshot(history_, file_timestamp_, file_digest_, view_),
        true);
}

std::expected<void, std::error_code> kaku::session_t::flush_history()
{
    log_writer_.drain();
    if (!last_write_.valid())
    {
        return {};
    }
    return last_write_.get();
}

void kaku::session_t::refresh_find(std::stop_token const& stop_token)
{
    find_.update(document_, stop_token);
}

kaku::visual_position_t kaku::session_t::cursor_visual_position()
{
    return mapper_.logical_to_visual(document_,
        selection_.primary(),
        config_.wrap_width,
        view_.top_line);
}

void kaku::session_t::set_view(view_state_t const& view)
{
    view_ = {std::min(view.top_line, document_.line_count() - 1),
        document_.clamp(view.cursor)};
}

kaku::view_state_t const& kaku::session_t::view() const { return view_; }

bool kaku::session_t::modified() const { return history_.modified(); }

kaku::validation_result_t kaku::session_t::validation() const
{
    return validation_;
}

std::filesystem::path const& kaku::session_t::path() const { return path_; }

kaku::config_t const& kaku::session_t::config() const { return config_; }

kaku::document_t const& kaku::session_t::document() const
{
    return document_;
}

kaku::selection_model_t& kaku::session_t::selection() { return selection_; }

kaku::undo_history_t const& kaku::session_t::history() const
{
    return history_;
}

kaku::edit_engine_t& kaku::session_t::engine() { return engine_; }

kaku::find_state_t& kaku::session_t::find() { return find_; }

kaku::find_history_t& kaku::session_t::find_history()
{
    return find_history_;
}

kaku::coordinate_mapper_t& kaku::session_t::mapper() { return mapper_; }

void kaku::session_t::on_history_event(history_event_t const& event)
{
    view_.cursor = selection_.primary();

    if (!store_)
    {
        return;
    }

    switch (event.kind)
    {
    case history_event_kind_t::push:
        write_log(push_record(*event.entry), false);
        evicted_since_compaction_ += event.evicted;
        if (evicted_since_compaction_ >= config_.compact_after_evictions)
        {
            spdlog::debug("{} undo entries evicted, compacting the log",
                evicted_since_compaction_);
            compact_history();
        }
        break;
    case history_event_kind_t::undo:
        write_log(undo_record(), false);
        break;
    case history_event_kind_t::redo:
        write_log(redo_record(), false);
        break;
    }
}

std::shared_future<std::expected<void, std::error_code>>
kaku::session_t::write_log(std::string records, bool const replace)
{
    last_write_ = log_writer_
                      .submit(
                          [store = store_, records = std::move(records), replace]()
                          {
                              std::expected<void, std::error_code> rv{replace
                                      ? store->replace(records)
                                      : store->append(records)};
                              if (!rv)
                              {
                                  spdlog::error("Undo log write failed: {}",
                                      rv.error().message());
                              }
                              return rv;
                          })
                      .share();
    return last_write_;
}
