#include <kaku_edit.hpp>
#include <kaku_undo_history.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace
{
    [[nodiscard]] kaku::history_entry_t typed(char32_t const c,
        size_t const col)
    {
        return {{kaku::insert_char_t{{0, col}, c}},
            {{0, col}, {}},
            {{0, col + 1}, {}}};
    }
} // namespace

TEST_CASE("Undo and redo walk the entries", "[kaku][undo_history]")
{
    kaku::undo_history_t history;
    CHECK_FALSE(history.can_undo());
    CHECK_FALSE(history.undo());

    history.push(typed(U'a', 0));
    history.push(typed(U'b', 1));
    CHECK(history.can_undo());
    CHECK_FALSE(history.can_redo());

    CHECK(history.undo() == typed(U'b', 1));
    CHECK(history.undo() == typed(U'a', 0));
    CHECK_FALSE(history.undo());
    CHECK(history.can_redo());

    CHECK(history.redo() == typed(U'a', 0));
    CHECK(history.current() == 1);
}

TEST_CASE("Pushing after undo drops the redo chain", "[kaku][undo_history]")
{
    kaku::undo_history_t history;
    history.push(typed(U'a', 0));
    history.push(typed(U'b', 1));
    REQUIRE(history.undo());

    history.push(typed(U'c', 1));
    CHECK_FALSE(history.can_redo());
    CHECK(history.entries().size() == 2);
    CHECK(history.undo() == typed(U'c', 1));
}

TEST_CASE("Modified flag follows the saved position", "[kaku][undo_history]")
{
    kaku::undo_history_t history;
    CHECK_FALSE(history.modified());

    history.push(typed(U'a', 0));
    CHECK(history.modified());

    history.mark_saved();
    CHECK_FALSE(history.modified());

    REQUIRE(history.undo());
    CHECK(history.modified());
    REQUIRE(history.redo());
    CHECK_FALSE(history.modified());

    REQUIRE(history.undo());
    history.push(typed(U'z', 0));
    CHECK(history.modified());
    CHECK_FALSE(history.saved_at());
}

TEST_CASE("Undoing everything returns to the unmodified state",
    "[kaku][undo_history]")
{
    kaku::undo_history_t history;
    history.push(typed(U'a', 0));
    history.push(typed(U'b', 1));

    REQUIRE(history.undo());
    REQUIRE(history.undo());
    CHECK_FALSE(history.modified());
}

TEST_CASE("Oldest entries are evicted first", "[kaku][undo_history]")
{
    kaku::undo_history_t history{{.max_entries = 3}};

    CHECK(history.push(typed(U'a', 0)) == 0);
    history.push(typed(U'b', 1));
    history.push(typed(U'c', 2));
    CHECK(history.push(typed(U'd', 3)) == 1);

    CHECK(history.entries().size() == 3);
    CHECK(history.current() == 3);
    CHECK(history.entries().front() == typed(U'b', 1));

    // The saved baseline was evicted with the first entry.
    CHECK_FALSE(history.saved_at());
    CHECK(history.modified());
}

TEST_CASE("Byte limit evicts large entries", "[kaku][undo_history]")
{
    kaku::history_entry_t const big{
        {kaku::insert_text_block_t{{0, 0}, std::u32string(1000, U'x')}},
        {},
        {}};

    kaku::undo_history_t history{
        {.max_entries = 100, .max_bytes = kaku::content_size(big) * 2}};

    history.push(big);
    history.push(big);
    CHECK(history.entries().size() == 2);
    history.push(big);
    CHECK(history.entries().size() == 2);
    CHECK(history.content_bytes() <= history.limits().max_bytes);
}

TEST_CASE("Saved marker moves with eviction", "[kaku][undo_history]")
{
    kaku::undo_history_t history{{.max_entries = 2}};

    history.push(typed(U'a', 0));
    history.push(typed(U'b', 1));
    history.mark_saved();
    history.push(typed(U'c', 2));

    CHECK(history.saved_at() == std::optional<size_t>{1});
    REQUIRE(history.undo());
    CHECK_FALSE(history.modified());
}

TEST_CASE("Restore validates indices", "[kaku][undo_history]")
{
    kaku::undo_history_t history;

    CHECK_FALSE(history.restore({typed(U'a', 0)}, 2, 0));
    REQUIRE(history.restore({typed(U'a', 0), typed(U'b', 1)}, 1, 0));
    CHECK(history.can_redo());
    CHECK(history.modified());
    CHECK(history.content_bytes() != 0);

    history.clear();
    CHECK(history.entries().empty());
    CHECK_FALSE(history.modified());
}
