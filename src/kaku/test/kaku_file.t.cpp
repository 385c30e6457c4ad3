#include <kaku_file.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <random>
#include <string>

namespace
{
    [[nodiscard]] std::filesystem::path scratch_directory()
    {
        std::random_device device;
        return std::filesystem::temp_directory_path() /
            ("kaku_file_test_" + std::to_string(device()));
    }
} // namespace

TEST_CASE("Written files read back", "[kaku][file]")
{
    std::filesystem::path const root{scratch_directory()};
    std::filesystem::path const path{root / "nested" / "file.txt"};

    REQUIRE(kaku::write_file(path, "first\n"));
    CHECK(kaku::read_file(path) == std::string{"first\n"});

    REQUIRE(kaku::write_file(path, "second"));
    CHECK(kaku::read_file(path) == std::string{"second"});
    CHECK_FALSE(std::filesystem::exists(root / "nested" / "file.txt.tmp"));

    REQUIRE(kaku::append_file(path, "\nthird"));
    CHECK(kaku::read_file(path) == std::string{"second\nthird"});

    CHECK(kaku::file_timestamp(path).has_value());

    std::filesystem::remove_all(root);
}

TEST_CASE("Missing files are reported", "[kaku][file]")
{
    std::filesystem::path const path{scratch_directory() / "missing.txt"};

    auto const content{kaku::read_file(path)};
    REQUIRE_FALSE(content);
    CHECK(content.error() == std::errc::no_such_file_or_directory);

    CHECK_FALSE(kaku::file_timestamp(path));
}

TEST_CASE("Content digest", "[kaku][file]")
{
    CHECK(kaku::content_digest("123456789") ==
        kaku::content_digest_t{0xCBF43926, 9});
    CHECK(kaku::content_digest("") == kaku::content_digest_t{0, 0});
    CHECK(kaku::content_digest("abc") != kaku::content_digest("abd"));
}
