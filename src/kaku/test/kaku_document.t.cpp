#include <kaku_document.hpp>
#include <kaku_error.hpp>
#include <kaku_position.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Empty document has one empty line", "[kaku][document]")
{
    kaku::document_t const doc;

    CHECK(doc.line_count() == 1);
    CHECK(doc[0].empty());
    CHECK(doc.text().empty());
    CHECK(doc.end() == kaku::position_t{0, 0});
}

TEST_CASE("Insert splits text on line breaks", "[kaku][document]")
{
    kaku::document_t doc{U"hello world"};

    auto const end{doc.insert({0, 5}, U",\nbig\nnew")};
    REQUIRE(end);
    CHECK(*end == kaku::position_t{2, 3});
    CHECK(doc.line_count() == 3);
    CHECK(doc[0] == U"hello,");
    CHECK(doc[1] == U"big");
    CHECK(doc[2] == U"new world");

    auto const single{doc.insert({1, 0}, U"a ")};
    REQUIRE(single);
    CHECK(*single == kaku::position_t{1, 2});
    CHECK(doc[1] == U"a big");
}

TEST_CASE("Erase across lines joins them", "[kaku][document]")
{
    kaku::document_t doc{U"one\ntwo\nthree"};

    auto const removed{doc.erase({{0, 2}, {2, 1}})};
    REQUIRE(removed);
    CHECK(*removed == U"e\ntwo\nt");
    CHECK(doc.line_count() == 1);
    CHECK(doc[0] == U"onhree");
}

TEST_CASE("Out of range operations leave the document unchanged",
    "[kaku][document]")
{
    kaku::document_t doc{U"abc\nde"};

    auto const insert{doc.insert({0, 4}, U"x")};
    REQUIRE_FALSE(insert);
    CHECK(insert.error() == kaku::error_t::out_of_bounds);

    auto const erase{doc.erase({{0, 1}, {3, 0}})};
    REQUIRE_FALSE(erase);
    CHECK(erase.error() == kaku::error_t::out_of_bounds);

    auto const reversed{doc.erase({{1, 1}, {0, 1}})};
    REQUIRE_FALSE(reversed);

    CHECK_FALSE(doc.line(2));
    CHECK_FALSE(doc.char_at({1, 2}));
    CHECK(doc.text() == U"abc\nde");
}

TEST_CASE("Characters are indexed by scalar value", "[kaku][document]")
{
    kaku::document_t const doc{U"aé\U0001F600b\nx"};

    CHECK(doc.line_length(0) == 4);
    CHECK(doc.char_at({0, 2}) == U'\U0001F600');
    CHECK(doc.char_at({0, 4}) == U'\n');
    CHECK(doc.text({{0, 1}, {0, 3}}) == U"é\U0001F600");
}

TEST_CASE("Whole document load normalizes line endings", "[kaku][document]")
{
    kaku::document_t doc;
    doc.set_text(U"a\r\nb\rc\n");

    CHECK(doc.line_count() == 4);
    CHECK(doc.text() == U"a\nb\nc\n");
    CHECK(doc[3].empty());
}

TEST_CASE("Line revisions change with content", "[kaku][document]")
{
    kaku::document_t doc{U"first\nsecond"};

    auto const first{doc.line_revision(0)};
    auto const second{doc.line_revision(1)};
    CHECK(first != second);

    REQUIRE(doc.insert({1, 0}, U"x"));
    CHECK(doc.line_revision(0) == first);
    CHECK(doc.line_revision(1) != second);
}

TEST_CASE("Clamp limits positions to the document", "[kaku][document]")
{
    kaku::document_t const doc{U"abc\nde"};

    CHECK(doc.clamp({0, 10}) == kaku::position_t{0, 3});
    CHECK(doc.clamp({7, 1}) == kaku::position_t{1, 1});
    CHECK(doc.size() == 6);
}
