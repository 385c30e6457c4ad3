#include <kaku_clipboard.hpp>
#include <kaku_config.hpp>
#include <kaku_coordinate_mapper.hpp>
#include <kaku_error.hpp>
#include <kaku_file.hpp>
#include <kaku_find.hpp>
#include <kaku_history_log.hpp>
#include <kaku_session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace
{
    [[nodiscard]] std::filesystem::path scratch_directory()
    {
        std::random_device device;
        return std::filesystem::temp_directory_path() /
            ("kaku_session_test_" + std::to_string(device()));
    }

    [[nodiscard]] kaku::config_t test_config(
        std::filesystem::path const& root)
    {
        kaku::config_t rv;
        rv.history_root = root / "history";
        return rv;
    }
} // namespace

TEST_CASE("Missing files open empty and save", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "new.txt"};
    kaku::memory_clipboard_t clipboard;

    {
        kaku::session_t session{test_config(root), clipboard};
        REQUIRE(session.open(path));
        CHECK(session.document().text().empty());
        CHECK_FALSE(session.modified());

        REQUIRE(session.engine().insert_text(U"héllo"));
        REQUIRE(session.engine().split_line());
        CHECK(session.modified());

        REQUIRE(session.save());
        CHECK_FALSE(session.modified());
        CHECK(kaku::read_file(path) == std::string{"héllo\n"});

        REQUIRE(session.flush_history());
    }

    CHECK(std::filesystem::exists(kaku::file_history_store_t::path_for(
        root / "history",
        path)));

    std::filesystem::remove_all(root);
}

TEST_CASE("Unsaved edits come back as redo", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "notes.txt"};
    REQUIRE(kaku::write_file(path, "abc"));

    auto const store{std::make_shared<kaku::memory_history_store_t>()};
    kaku::memory_clipboard_t clipboard;

    {
        kaku::session_t session{test_config(root), clipboard};
        REQUIRE(session.open(path, store));

        session.selection().navigate({0, 3});
        REQUIRE(session.engine().insert_text(U"d"));
        REQUIRE(session.save());
        REQUIRE(session.engine().insert_text(U"e"));
        REQUIRE(session.flush_history());
    }

    kaku::session_t session{test_config(root), clipboard};
    REQUIRE(session.open(path, store));
    CHECK(session.validation() == kaku::validation_result_t::valid);
    CHECK(session.document().text() == U"abcd");
    CHECK_FALSE(session.modified());
    CHECK(session.view().cursor == kaku::position_t{0, 4});

    REQUIRE(session.engine().redo());
    CHECK(session.document().text() == U"abcde");

    REQUIRE(session.engine().undo());
    REQUIRE(session.engine().undo());
    CHECK(session.document().text() == U"abc");

    std::filesystem::remove_all(root);
}

TEST_CASE("History of a file changed on disk is discarded",
    "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "notes.txt"};
    REQUIRE(kaku::write_file(path, "abc"));

    auto const store{std::make_shared<kaku::memory_history_store_t>()};
    kaku::memory_clipboard_t clipboard;

    {
        kaku::session_t session{test_config(root), clipboard};
        REQUIRE(session.open(path, store));
        REQUIRE(session.engine().insert_text(U"x"));
        REQUIRE(session.save());
        REQUIRE(session.flush_history());
    }

    REQUIRE(kaku::write_file(path, "changed elsewhere"));
    std::filesystem::last_write_time(path,
        std::filesystem::file_time_type::clock::now() - std::chrono::hours{1});

    kaku::session_t session{test_config(root), clipboard};
    REQUIRE(session.open(path, store));
    CHECK(session.validation() ==
        kaku::validation_result_t::modified_no_unsaved);
    CHECK(session.document().text() == U"changed elsewhere");
    CHECK_FALSE(session.history().can_undo());

    std::filesystem::remove_all(root);
}

namespace
{
    [[nodiscard]] size_t count_records(std::string_view const log,
        std::string_view const kind)
    {
        std::string const needle{"\"kind\":\"" + std::string{kind} + "\""};
        size_t rv{};
        for (size_t at{log.find(needle)}; at != std::string_view::npos;
            at = log.find(needle, at + needle.size()))
        {
            ++rv;
        }
        return rv;
    }
} // namespace

TEST_CASE("Evictions append until the log is compacted", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    kaku::memory_clipboard_t clipboard;

    kaku::config_t config{test_config(root)};
    config.history_limits.max_entries = 2;

    SECTION("below the threshold every push is appended")
    {
        auto const store{std::make_shared<kaku::memory_history_store_t>()};
        kaku::session_t session{config, clipboard};
        REQUIRE(session.open(root / "missing.txt", store));
        for (char32_t const c : std::u32string_view{U"abcde"})
        {
            REQUIRE(session.engine().insert_text(std::u32string(1, c)));
        }
        REQUIRE(session.flush_history());

        std::string const log{*store->load()};
        CHECK(count_records(log, "header") == 1);
        CHECK(count_records(log, "push") == 5);

        kaku::loaded_history_t const loaded{
            kaku::load_history(*store, config.history_limits)};
        CHECK(loaded.history.entries() == session.history().entries());
        CHECK_FALSE(loaded.history.saved_at());
    }

    SECTION("reaching the threshold rewrites the log")
    {
        config.compact_after_evictions = 2;

        auto const store{std::make_shared<kaku::memory_history_store_t>()};
        kaku::session_t session{config, clipboard};
        REQUIRE(session.open(root / "missing.txt", store));
        for (char32_t const c : std::u32string_view{U"abcde"})
        {
            REQUIRE(session.engine().insert_text(std::u32string(1, c)));
        }
        REQUIRE(session.flush_history());

        std::string const log{*store->load()};
        CHECK(count_records(log, "header") == 1);
        CHECK(count_records(log, "push") == 3);

        kaku::loaded_history_t const loaded{
            kaku::load_history(*store, config.history_limits)};
        CHECK(loaded.history.entries() == session.history().entries());
        CHECK(loaded.history.entries().size() == 2);
        CHECK_FALSE(loaded.history.saved_at());
    }

    std::filesystem::remove_all(root);
}

TEST_CASE("History is checked against the file content", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "notes.txt"};
    auto const store{std::make_shared<kaku::memory_history_store_t>()};
    kaku::memory_clipboard_t clipboard;

    SECTION("replaced within the same second")
    {
        REQUIRE(kaku::write_file(path, "abc"));
        {
            kaku::session_t session{test_config(root), clipboard};
            REQUIRE(session.open(path, store));
            REQUIRE(session.engine().insert_text(U"x"));
            REQUIRE(session.save());
            REQUIRE(session.flush_history());
        }

        auto const saved_time{std::filesystem::last_write_time(path)};
        REQUIRE(kaku::write_file(path, "zzzz"));
        std::filesystem::last_write_time(path, saved_time);

        kaku::session_t session{test_config(root), clipboard};
        REQUIRE(session.open(path, store));
        CHECK(session.validation() ==
            kaku::validation_result_t::modified_no_unsaved);
        CHECK(session.document().text() == U"zzzz");
        CHECK_FALSE(session.history().can_undo());
    }

    SECTION("created after the history was recorded")
    {
        {
            kaku::session_t session{test_config(root), clipboard};
            REQUIRE(session.open(path, store));
            REQUIRE(session.engine().insert_text(U"draft"));
            REQUIRE(session.flush_history());
        }

        REQUIRE(kaku::write_file(path, "written elsewhere"));

        kaku::session_t session{test_config(root), clipboard};
        REQUIRE(session.open(path, store));
        CHECK(session.validation() ==
            kaku::validation_result_t::modified_with_unsaved);
        CHECK(session.document().text() == U"written elsewhere");
        CHECK_FALSE(session.history().can_undo());
        CHECK_FALSE(session.history().can_redo());
    }

    std::filesystem::remove_all(root);
}

TEST_CASE("Invalid files are refused", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "binary.bin"};
    REQUIRE(kaku::write_file(path, std::string{"\xff\xfe", 2}));

    kaku::memory_clipboard_t clipboard;
    kaku::config_t config{test_config(root)};
    config.persist_history = false;

    kaku::session_t session{config, clipboard};
    auto const opened{session.open(path)};
    REQUIRE_FALSE(opened);
    CHECK(opened.error() == kaku::error_t::invalid_encoding);

    auto const saved{session.save()};
    REQUIRE_FALSE(saved);
    CHECK(saved.error() == kaku::error_t::io_error);

    std::filesystem::remove_all(root);
}

TEST_CASE("Find and replace through the session", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "list.txt"};
    REQUIRE(kaku::write_file(path, "item1\nitem2\nother"));

    kaku::memory_clipboard_t clipboard;
    kaku::config_t config{test_config(root)};
    config.persist_history = false;

    kaku::session_t session{config, clipboard};
    REQUIRE(session.open(path));

    session.find().set_pattern(U"item(\\d)");
    session.refresh_find();
    CHECK(session.find().hit_count() == std::pair<size_t, size_t>{0, 2});

    REQUIRE(kaku::replace_all(session.engine(),
        session.document(),
        session.find(),
        U"entry-$1"));
    CHECK(session.document().text() == U"entry-1\nentry-2\nother");
    CHECK(session.history().entries().size() == 1);

    session.refresh_find();
    CHECK(session.find().matches().empty());

    std::filesystem::remove_all(root);
}

TEST_CASE("View state and wrapped cursor position", "[kaku][session]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "wrap.txt"};
    REQUIRE(kaku::write_file(path, "abcdefghij\nxy"));

    auto const store{std::make_shared<kaku::memory_history_store_t>()};
    kaku::memory_clipboard_t clipboard;
    kaku::config_t config{test_config(root)};
    config.wrap_width = 4;

    kaku::session_t session{config, clipboard};
    REQUIRE(session.open(path, store));
    CHECK(session.path() == path);
    CHECK(session.config().wrap_width == 4);

    session.selection().navigate({0, 9});
    CHECK(session.cursor_visual_position() == kaku::visual_position_t{2, 1});

    session.selection().navigate({1, 1});
    CHECK(session.cursor_visual_position() == kaku::visual_position_t{3, 1});
    CHECK(session.mapper().segments(session.document(), 0, 4).size() ==
        3);

    session.set_view({5, {9, 9}});
    CHECK(session.view() == kaku::view_state_t{1, {1, 2}});
    CHECK(session.cursor_visual_position() == kaku::visual_position_t{0, 1});

    REQUIRE(session.compact_history().get());
    kaku::loaded_history_t const loaded{
        kaku::load_history(*store, config.history_limits)};
    CHECK(loaded.view == kaku::view_state_t{1, {1, 2}});

    std::filesystem::remove_all(root);
}
