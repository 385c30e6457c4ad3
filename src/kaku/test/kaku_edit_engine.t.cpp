#include <kaku_clipboard.hpp>
#include <kaku_document.hpp>
#include <kaku_edit.hpp>
#include <kaku_edit_engine.hpp>
#include <kaku_error.hpp>
#include <kaku_position.hpp>
#include <kaku_selection.hpp>
#include <kaku_undo_history.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace
{
    struct [[nodiscard]] fixture_t final
    {
        explicit fixture_t(std::u32string_view const text) : document{text}
        {
        }

        kaku::document_t document;
        kaku::selection_model_t selection;
        kaku::undo_history_t history;
        kaku::memory_clipboard_t clipboard;
        kaku::edit_engine_t engine{document, selection, history, clipboard};
    };
} // namespace

TEST_CASE("Typing at several cursors is one undo unit", "[kaku][edit_engine]")
{
    fixture_t f{U"abc\nabc\nabc"};
    f.selection.set_cursors({0, 1}, {{1, 1}, {2, 1}});

    auto const entry{f.engine.insert_text(U"x")};
    REQUIRE(entry);
    REQUIRE(entry->has_value());
    CHECK((*entry)->edits.size() == 3);

    CHECK(f.document.text() == U"axbc\naxbc\naxbc");
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 2}, {1, 2}, {2, 2}});
    CHECK(f.history.entries().size() == 1);

    REQUIRE(f.engine.undo());
    CHECK(f.document.text() == U"abc\nabc\nabc");
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 1}, {1, 1}, {2, 1}});
}

TEST_CASE("Cursors on one line shift by the inserted length",
    "[kaku][edit_engine]")
{
    fixture_t f{U"abcd"};
    f.selection.set_cursors({0, 1}, {{0, 3}});

    REQUIRE(f.engine.insert_text(U"XY"));

    CHECK(f.document.text() == U"aXYbcXYd");
    CHECK(f.selection.primary() == kaku::position_t{0, 3});
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 3}, {0, 7}});
}

TEST_CASE("Three cursors on one line type and delete together",
    "[kaku][edit_engine]")
{
    fixture_t f{U"abcdef"};
    f.selection.set_cursors({0, 1}, {{0, 3}, {0, 5}});

    SECTION("Text on the same line")
    {
        REQUIRE(f.engine.insert_text(U"XY"));
        CHECK(f.document.text() == U"aXYbcXYdeXYf");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{0, 3}, {0, 7}, {0, 11}});

        REQUIRE(f.engine.delete_backward());
        CHECK(f.document.text() == U"aXbcXdeXf");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{0, 2}, {0, 5}, {0, 8}});

        REQUIRE(f.engine.undo());
        REQUIRE(f.engine.undo());
        CHECK(f.document.text() == U"abcdef");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{0, 1}, {0, 3}, {0, 5}});
    }

    SECTION("Text with a line break")
    {
        REQUIRE(f.engine.insert_text(U"X\nY"));
        CHECK(f.document.text() == U"aX\nYbcX\nYdeX\nYf");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{1, 1}, {2, 1}, {3, 1}});

        REQUIRE(f.engine.delete_backward());
        CHECK(f.document.text() == U"aX\nbcX\ndeX\nf");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{1, 0}, {2, 0}, {3, 0}});

        REQUIRE(f.engine.delete_backward());
        CHECK(f.document.text() == U"aXbcXdeXf");
        CHECK(f.selection.cursors() ==
            std::vector<kaku::position_t>{{0, 2}, {0, 5}, {0, 8}});

        CHECK(f.history.entries().size() == 3);
        REQUIRE(f.engine.undo());
        REQUIRE(f.engine.undo());
        REQUIRE(f.engine.undo());
        CHECK(f.document.text() == U"abcdef");
    }
}

TEST_CASE("Zero width block types on every row", "[kaku][edit_engine]")
{
    fixture_t f{U"one\ntwo\nthree"};
    f.selection.start_selection({0, 1}, kaku::selection_kind_t::block);
    f.selection.extend_selection({2, 1});

    REQUIRE(f.engine.insert_text(U"a"));
    CHECK(f.document.text() == U"oane\ntawo\ntahree");
    CHECK(f.history.entries().size() == 1);
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 2}, {1, 2}, {2, 2}});

    REQUIRE(f.engine.undo());
    CHECK(f.document.text() == U"one\ntwo\nthree");
    CHECK_FALSE(f.history.can_undo());
}

TEST_CASE("Deleting a block removes the column span of each row",
    "[kaku][edit_engine]")
{
    fixture_t f{U"0123456789\nabc\n"};
    f.selection.start_selection({0, 2}, kaku::selection_kind_t::block);
    f.selection.extend_selection({2, 5});

    REQUIRE(f.engine.delete_backward());
    CHECK(f.document.text() == U"0156789\nab\n");
    CHECK(std::holds_alternative<kaku::no_selection_t>(
        f.selection.selection()));
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 2}, {1, 2}, {2, 0}});
}

TEST_CASE("Line boundaries join from either side", "[kaku][edit_engine]")
{
    fixture_t backward{U"ab\ncd"};
    backward.selection.navigate({1, 0});
    REQUIRE(backward.engine.delete_backward());

    fixture_t forward{U"ab\ncd"};
    forward.selection.navigate({0, 2});
    REQUIRE(forward.engine.delete_forward());

    CHECK(backward.document.text() == U"abcd");
    CHECK(forward.document.text() == backward.document.text());
    CHECK(backward.selection.primary() == kaku::position_t{0, 2});
    CHECK(forward.selection.primary() == kaku::position_t{0, 2});

    fixture_t start{U"ab"};
    auto const nothing{start.engine.delete_backward()};
    REQUIRE(nothing);
    CHECK_FALSE(nothing->has_value());
    CHECK(start.history.entries().empty());
}

TEST_CASE("Backspace at several cursors joins and deletes",
    "[kaku][edit_engine]")
{
    fixture_t f{U"ab\ncd"};
    f.selection.set_cursors({0, 1}, {{1, 0}});

    REQUIRE(f.engine.delete_backward());
    CHECK(f.document.text() == U"bcd");
    CHECK(f.selection.cursors() ==
        std::vector<kaku::position_t>{{0, 0}, {0, 1}});
}

TEST_CASE("Selections are deleted before typing", "[kaku][edit_engine]")
{
    fixture_t f{U"hello\nworld"};
    f.selection.start_selection({0, 2}, kaku::selection_kind_t::line);
    f.selection.extend_selection({1, 3});

    REQUIRE(f.engine.insert_text(U"X"));
    CHECK(f.document.text() == U"heXld");
    CHECK(f.selection.primary() == kaku::position_t{0, 3});
    CHECK(f.history.entries().size() == 1);

    REQUIRE(f.engine.undo());
    CHECK(f.document.text() == U"hello\nworld");
}

TEST_CASE("Word deletion skips separators first", "[kaku][edit_engine]")
{
    fixture_t f{U"foo bar_baz  qux"};
    f.selection.navigate({0, 16});

    REQUIRE(f.engine.delete_word_backward());
    CHECK(f.document.text() == U"foo bar_baz  ");
    CHECK(f.selection.primary() == kaku::position_t{0, 13});

    REQUIRE(f.engine.delete_word_backward());
    CHECK(f.document.text() == U"foo ");
    CHECK(f.selection.primary() == kaku::position_t{0, 4});

    f.selection.navigate({0, 0});
    REQUIRE(f.engine.delete_word_forward());
    CHECK(f.document.text() == U" ");
    CHECK(f.selection.primary() == kaku::position_t{0, 0});
}

TEST_CASE("Tab inserts spaces", "[kaku][edit_engine]")
{
    fixture_t f{U"x"};
    REQUIRE(f.engine.insert_tab(4));
    CHECK(f.document.text() == U"    x");
    CHECK(f.selection.primary() == kaku::position_t{0, 4});
}

TEST_CASE("Cut and paste go through the clipboard", "[kaku][edit_engine]")
{
    fixture_t f{U"hello world"};
    f.selection.start_selection({0, 0}, kaku::selection_kind_t::line);
    f.selection.extend_selection({0, 5});

    REQUIRE(f.engine.cut());
    CHECK(f.document.text() == U" world");
    CHECK(f.clipboard.get_text() == U"hello");

    f.selection.navigate({0, 6});
    REQUIRE(f.engine.paste());
    CHECK(f.document.text() == U" worldhello");
    CHECK(f.selection.primary() == kaku::position_t{0, 11});
    CHECK(f.history.entries().size() == 2);

    CHECK_FALSE(f.engine.copy());
}

TEST_CASE("Pasting one line per cursor", "[kaku][edit_engine]")
{
    fixture_t f{U"a\nb\nc"};
    f.clipboard.set_text(U"1\n2\n3\n");
    f.selection.set_cursors({1, 1}, {{0, 1}, {2, 1}});

    REQUIRE(f.engine.paste());
    CHECK(f.document.text() == U"a1\nb2\nc3");

    fixture_t g{U"a\nb"};
    g.clipboard.set_text(U"xy");
    g.selection.set_cursors({0, 1}, {{1, 1}});
    REQUIRE(g.engine.paste());
    CHECK(g.document.text() == U"axy\nbxy");
}

TEST_CASE("Replacing a range leaves the cursor after it",
    "[kaku][edit_engine]")
{
    fixture_t f{U"this is test15"};

    REQUIRE(f.engine.replace_range({{0, 8}, {0, 14}}, U"Hello15"));
    CHECK(f.document.text() == U"this is Hello15");
    CHECK(f.selection.primary() == kaku::position_t{0, 15});

    fixture_t g{U"a-b-c"};
    REQUIRE(g.engine.replace_ranges({{{{0, 1}, {0, 2}}, U"+"},
        {{{0, 3}, {0, 4}}, U"++"}}));
    CHECK(g.document.text() == U"a+b++c");
    CHECK(g.history.entries().size() == 1);

    auto const overlapping{g.engine.replace_ranges(
        {{{{0, 0}, {0, 3}}, U""}, {{{0, 2}, {0, 4}}, U""}})};
    REQUIRE_FALSE(overlapping);
    CHECK(overlapping.error() == kaku::error_t::out_of_bounds);
    CHECK(g.document.text() == U"a+b++c");
}

TEST_CASE("Blocks move and copy as one unit", "[kaku][edit_engine]")
{
    fixture_t f{U"one two three"};
    kaku::range_t const source{{0, 0}, {0, 4}};

    auto const inside{f.engine.move_block(source, {0, 2}, false)};
    REQUIRE(inside);
    CHECK_FALSE(inside->has_value());

    REQUIRE(f.engine.move_block(source, {0, 8}, false));
    CHECK(f.document.text() == U"two one three");
    CHECK(f.selection.normalized_range() == kaku::range_t{{0, 4}, {0, 8}});
    CHECK(f.history.entries().size() == 1);

    REQUIRE(f.engine.move_block({{0, 8}, {0, 13}}, {0, 0}, true));
    CHECK(f.document.text() == U"threetwo one three");

    REQUIRE(f.engine.undo());
    REQUIRE(f.engine.undo());
    CHECK(f.document.text() == U"one two three");
}

TEST_CASE("Undo and redo replay every entry", "[kaku][edit_engine]")
{
    fixture_t f{U"start"};
    f.selection.navigate({0, 5});

    REQUIRE(f.engine.insert_text(U" hello"));
    REQUIRE(f.engine.split_line());
    REQUIRE(f.engine.insert_text(U"wörld"));
    REQUIRE(f.engine.delete_backward());
    f.selection.add_cursor_above(f.document);
    REQUIRE(f.engine.insert_text(U"!"));
    REQUIRE(f.engine.join_line(0));

    std::u32string const final_text{f.document.text()};
    kaku::cursor_state_t const final_cursors{f.selection.cursor_state()};
    size_t const entries{f.history.entries().size()};
    REQUIRE(entries == 6);

    for (size_t i{}; i != entries; ++i)
    {
        REQUIRE(f.engine.undo());
    }
    CHECK(f.document.text() == U"start");
    CHECK(f.selection.primary() == kaku::position_t{0, 5});

    for (size_t i{}; i != entries; ++i)
    {
        REQUIRE(f.engine.redo());
    }
    CHECK(f.document.text() == final_text);
    CHECK(f.selection.cursor_state() == final_cursors);

    auto const past_end{f.engine.redo()};
    REQUIRE(past_end);
    CHECK_FALSE(past_end->has_value());
}

TEST_CASE("Failed undo leaves the document untouched", "[kaku][edit_engine]")
{
    fixture_t f{U"ab"};
    kaku::history_entry_t const entry{
        {kaku::insert_char_t{{0, 0}, U'z'}, kaku::insert_char_t{{0, 1}, U'b'}},
        {},
        {}};

    auto const result{f.engine.apply_undo(entry)};
    REQUIRE_FALSE(result);
    CHECK(result.error() == kaku::error_t::history_mismatch);
    CHECK(f.document.text() == U"ab");
}

TEST_CASE("Positions outside the document are rejected",
    "[kaku][edit_engine]")
{
    fixture_t f{U"ab\ncd"};

    auto const split{f.engine.split_line({5, 0})};
    REQUIRE_FALSE(split);
    CHECK(split.error() == kaku::error_t::out_of_bounds);

    auto const join{f.engine.join_line(1)};
    REQUIRE_FALSE(join);
    CHECK(join.error() == kaku::error_t::out_of_bounds);

    CHECK(f.document.text() == U"ab\ncd");
    CHECK(f.history.entries().empty());
}

TEST_CASE("History listener sees pushes, undo and redo",
    "[kaku][edit_engine]")
{
    fixture_t f{U""};

    std::vector<kaku::history_event_kind_t> events;
    f.engine.set_history_listener([&events](kaku::history_event_t const& e)
        { events.push_back(e.kind); });

    REQUIRE(f.engine.insert_text(U"a"));
    REQUIRE(f.engine.undo());
    REQUIRE(f.engine.redo());

    CHECK(events ==
        std::vector<kaku::history_event_kind_t>{
            kaku::history_event_kind_t::push,
            kaku::history_event_kind_t::undo,
            kaku::history_event_kind_t::redo});
}
