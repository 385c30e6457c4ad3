#include <kaku_history_log.hpp>

#include <kaku_error.hpp>
#include <kaku_file.hpp>
#include <kaku_unicode.hpp>

#include <cppext_overloaded.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace
{
    class [[nodiscard]] malformed_record_t final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    [[nodiscard]] std::u32string decode(nlohmann::json const& j)
    {
        std::expected<std::u32string, std::error_code> rv{
            kaku::to_utf32(j.get<std::string>())};
        if (!rv)
        {
            throw malformed_record_t{"text is not valid UTF-8"};
        }
        return *std::move(rv);
    }

    [[nodiscard]] char32_t decode_char(nlohmann::json const& j)
    {
        std::u32string const text{decode(j)};
        if (text.size() != 1)
        {
            throw malformed_record_t{"expected a single character"};
        }
        return text.front();
    }

    [[nodiscard]] std::string encode_char(char32_t const c)
    {
        return kaku::to_utf8(std::u32string_view{&c, 1});
    }

    [[nodiscard]] std::string record(nlohmann::json const& j)
    {
        std::string rv{j.dump()};
        rv += '\n';
        return rv;
    }

    [[nodiscard]] std::string simple_record(std::string_view const kind)
    {
        return record({{"kind", kind}});
    }
} // namespace

namespace kaku
{
    void to_json(nlohmann::json& j, position_t const& p)
    {
        j = nlohmann::json::array({p.line, p.col});
    }

    void from_json(nlohmann::json const& j, position_t& p)
    {
        j.at(0).get_to(p.line);
        j.at(1).get_to(p.col);
    }

    void to_json(nlohmann::json& j, cursor_state_t const& s)
    {
        j = {{"primary", s.primary}, {"others", s.others}};
    }

    void from_json(nlohmann::json const& j, cursor_state_t& s)
    {
        j.at("primary").get_to(s.primary);
        j.at("others").get_to(s.others);
    }

    void to_json(nlohmann::json& j, edit_t const& edit)
    {
        j = std::visit(
            cppext::overloaded{
                [](insert_char_t const& e) -> nlohmann::json
                {
                    return {{"type", "insert_char"},
                        {"at", e.position},
                        {"char", encode_char(e.character)}};
                },
                [](delete_char_before_t const& e) -> nlohmann::json
                {
                    return {{"type", "delete_char_before"},
                        {"at", e.position},
                        {"char", encode_char(e.character)}};
                },
                [](delete_char_after_t const& e) -> nlohmann::json
                {
                    return {{"type", "delete_char_after"},
                        {"at", e.position},
                        {"char", encode_char(e.character)}};
                },
                [](split_line_t const& e) -> nlohmann::json
                { return {{"type", "split_line"}, {"at", e.position}}; },
                [](join_line_t const& e) -> nlohmann::json
                { return {{"type", "join_line"}, {"at", e.position}}; },
                [](insert_text_block_t const& e) -> nlohmann::json
                {
                    return {{"type", "insert_text"},
                        {"at", e.position},
                        {"text", to_utf8(e.text)}};
                },
                [](delete_range_t const& e) -> nlohmann::json
                {
                    return {{"type", "delete_range"},
                        {"at", e.range.start},
                        {"to", e.range.end},
                        {"text", to_utf8(e.text)}};
                }},
            edit);
    }

    void from_json(nlohmann::json const& j, edit_t& edit)
    {
        auto const type{j.at("type").get<std::string>()};
        auto const at{j.at("at").get<position_t>()};

        if (type == "insert_char")
        {
            edit = insert_char_t{at, decode_char(j.at("char"))};
        }
        else if (type == "delete_char_before")
        {
            edit = delete_char_before_t{at, decode_char(j.at("char"))};
        }
        else if (type == "delete_char_after")
        {
            edit = delete_char_after_t{at, decode_char(j.at("char"))};
        }
        else if (type == "split_line")
        {
            edit = split_line_t{at};
        }
        else if (type == "join_line")
        {
            edit = join_line_t{at};
        }
        else if (type == "insert_text")
        {
            edit = insert_text_block_t{at, decode(j.at("text"))};
        }
        else if (type == "delete_range")
        {
            range_t const range{at, j.at("to").get<position_t>()};
            if (range.end < range.start)
            {
                throw malformed_record_t{"reversed range"};
            }
            edit = delete_range_t{range, decode(j.at("text"))};
        }
        else
        {
            throw malformed_record_t{"unknown edit type " + type};
        }
    }

    void to_json(nlohmann::json& j, history_entry_t const& entry)
    {
        j = {{"edits", entry.edits},
            {"before", entry.before},
            {"after", entry.after}};
    }

    void from_json(nlohmann::json const& j, history_entry_t& entry)
    {
        j.at("edits").get_to(entry.edits);
        j.at("before").get_to(entry.before);
        j.at("after").get_to(entry.after);
    }
} // namespace kaku

std::expected<void, std::error_code> kaku::memory_history_store_t::append(
    std::string_view const records)
{
    content_ += records;
    return {};
}

std::expected<void, std::error_code> kaku::memory_history_store_t::replace(
    std::string_view const records)
{
    content_ = records;
    return {};
}

std::expected<std::string, std::error_code>
kaku::memory_history_store_t::load() const
{
    return content_;
}

kaku::file_history_store_t::file_history_store_t(std::filesystem::path path)
    : path_{std::move(path)}
{
}

std::filesystem::path kaku::file_history_store_t::path_for(
    std::filesystem::path const& root,
    std::filesystem::path const& document)
{
    std::error_code ec;
    std::filesystem::path absolute{std::filesystem::absolute(document, ec)};
    if (ec)
    {
        absolute = document;
    }

    std::filesystem::path canonical{
        std::filesystem::weakly_canonical(absolute, ec)};
    if (ec)
    {
        canonical = absolute;
    }

    std::filesystem::path rv{root / "files" / canonical.relative_path()};
    rv += ".ue";
    return rv;
}

std::filesystem::path const& kaku::file_history_store_t::path() const
{
    return path_;
}

std::expected<void, std::error_code> kaku::file_history_store_t::append(
    std::string_view const records)
{
    return append_file(path_, records);
}

std::expected<void, std::error_code> kaku::file_history_store_t::replace(
    std::string_view const records)
{
    return write_file(path_, records);
}

std::expected<std::string, std::error_code>
kaku::file_history_store_t::load() const
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        return std::string{};
    }

    return read_file(path_);
}

std::string kaku::header_record(std::optional<int64_t> const file_timestamp,
    std::optional<content_digest_t> const& file_digest,
    bool const saved_baseline)
{
    nlohmann::json j{{"kind", "header"},
        {"version", history_log_version},
        {"file_timestamp", nullptr},
        {"content", nullptr},
        {"saved_baseline", saved_baseline}};
    if (file_timestamp)
    {
        j["file_timestamp"] = *file_timestamp;
    }
    if (file_digest)
    {
        j["content"] = {{"crc", file_digest->crc}, {"size", file_digest->size}};
    }
    return record(j);
}

std::string kaku::push_record(history_entry_t const& entry)
{
    return record({{"kind", "push"}, {"entry", entry}});
}

std::string kaku::undo_record() { return simple_record("undo"); }

std::string kaku::redo_record() { return simple_record("redo"); }

std::string kaku::saved_record() { return simple_record("saved"); }

std::string kaku::cursor_record(view_state_t const& view)
{
    return record(
        {{"kind", "cursor"}, {"top_line", view.top_line}, {"at", view.cursor}});
}

std::string kaku::snapshot(undo_history_t const& history,
    std::optional<int64_t> const file_timestamp,
    std::optional<content_digest_t> const& file_digest,
    view_state_t const& view)
{
    std::optional<size_t> const saved_at{history.saved_at()};

    std::string rv{
        header_record(file_timestamp, file_digest, saved_at.has_value())};
    for (size_t i{}; i != history.entries().size(); ++i)
    {
        if (saved_at == i && i != 0)
        {
            rv += saved_record();
        }
        rv += push_record(history.entries()[i]);
    }

    if (saved_at == history.entries().size() && *saved_at != 0)
    {
        rv += saved_record();
    }

    for (size_t i{history.current()}; i != history.entries().size(); ++i)
    {
        rv += undo_record();
    }

    rv += cursor_record(view);

    return rv;
}

std::expected<kaku::loaded_history_t, std::error_code> kaku::parse_log(
    std::string_view const log,
    history_limits_t const& limits)
{
    loaded_history_t rv{
        undo_history_t{limits}, std::nullopt, {}, std::nullopt};

    std::vector<history_entry_t> entries;
    size_t current{};
    std::optional<size_t> saved_at{0};
    bool header_seen{false};

    auto const fail = [](std::string_view const reason, size_t const line)
    {
        spdlog::warn("Undo log rejected at line {}: {}", line, reason);
        return std::unexpected{make_error_code(error_t::persistence_error)};
    };

    size_t line_number{};
    size_t start{};
    while (start < log.size())
    {
        size_t end{log.find('\n', start)};
        if (end == std::string_view::npos)
        {
            end = log.size();
        }
        std::string_view const line{log.substr(start, end - start)};
        start = end + 1;
        ++line_number;

        if (line.empty())
        {
            continue;
        }

        try
        {
            nlohmann::json const j = nlohmann::json::parse(line);
            auto const kind{j.at("kind").get<std::string>()};

            if (!header_seen)
            {
                if (kind != "header" ||
                    j.at("version").get<int>() != history_log_version)
                {
                    return fail("missing or unsupported header", line_number);
                }

                header_seen = true;
                if (!j.at("file_timestamp").is_null())
                {
                    rv.file_timestamp = j.at("file_timestamp").get<int64_t>();
                }
                if (auto const content{j.find("content")};
                    content != j.end() && !content->is_null())
                {
                    rv.file_digest = content_digest_t{
                        content->at("crc").get<uint32_t>(),
                        content->at("size").get<size_t>()};
                }
                if (!j.value("saved_baseline", true))
                {
                    saved_at.reset();
                }
            }
            else if (kind == "push")
            {
                entries.resize(current);
                if (saved_at > current)
                {
                    saved_at.reset();
                }
                entries.push_back(j.at("entry").get<history_entry_t>());
                current = entries.size();
            }
            else if (kind == "undo")
            {
                if (current == 0)
                {
                    return fail("undo past the first entry", line_number);
                }
                --current;
            }
            else if (kind == "redo")
            {
                if (current == entries.size())
                {
                    return fail("redo past the last entry", line_number);
                }
                ++current;
            }
            else if (kind == "saved")
            {
                saved_at = current;
            }
            else if (kind == "cursor")
            {
                rv.view.top_line = j.at("top_line").get<size_t>();
                rv.view.cursor = j.at("at").get<position_t>();
            }
            else
            {
                return fail("unknown record kind", line_number);
            }
        }
        catch (nlohmann::json::exception const& ex)
        {
            return fail(ex.what(), line_number);
        }
        catch (malformed_record_t const& ex)
        {
            return fail(ex.what(), line_number);
        }
    }

    if (!header_seen)
    {
        return rv;
    }

    if (auto const restored{rv.history.restore(std::move(entries),
            current,
            saved_at)};
        !restored)
    {
        return std::unexpected{restored.error()};
    }

    return rv;
}

kaku::loaded_history_t kaku::load_history(history_store_t const& store,
    history_limits_t const& limits)
{
    std::expected<std::string, std::error_code> const log{store.load()};
    if (!log)
    {
        spdlog::warn("Undo log can't be read, starting with empty history: {}",
            log.error().message());
        return {undo_history_t{limits}, std::nullopt, {}, std::nullopt};
    }

    std::expected<loaded_history_t, std::error_code> parsed{
        parse_log(*log, limits)};
    if (!parsed)
    {
        spdlog::warn("Undo log is corrupt, starting with empty history");
        return {undo_history_t{limits}, std::nullopt, {}, std::nullopt};
    }

    spdlog::debug("Loaded {} undo entries",
        parsed->history.entries().size());

    return *std::move(parsed);
}

kaku::validation_result_t kaku::validate(loaded_history_t const& loaded,
    std::optional<int64_t> const current_file_timestamp,
    std::optional<content_digest_t> const& current_file_digest)
{
    bool const unchanged{loaded.file_digest && current_file_digest
            ? *loaded.file_digest == *current_file_digest
            : !loaded.file_timestamp || !current_file_timestamp ||
                *loaded.file_timestamp == *current_file_timestamp};
    if (unchanged)
    {
        return validation_result_t::valid;
    }

    return loaded.history.modified()
        ? validation_result_t::modified_with_unsaved
        : validation_result_t::modified_no_unsaved;
}
