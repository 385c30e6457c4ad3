#include <kaku_config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdlib.h>

TEST_CASE("History root follows the environment", "[kaku][config]")
{
    REQUIRE(setenv("KAKU_HOME", "/tmp/kaku_config_test", 1) == 0);
    CHECK(kaku::default_history_root() == "/tmp/kaku_config_test");

    REQUIRE(unsetenv("KAKU_HOME") == 0);
    REQUIRE(setenv("HOME", "/home/someone", 1) == 0);
    CHECK(kaku::default_history_root() == "/home/someone/.kaku");
}

TEST_CASE("Defaults", "[kaku][config]")
{
    kaku::config_t const config{kaku::default_config()};

    CHECK(config.wrap_width == kaku::default_wrap_width);
    CHECK(config.tab_width == kaku::default_tab_width);
    CHECK_FALSE(config.case_sensitive);
    CHECK(config.persist_history);
    CHECK(config.history_limits.max_entries == 1000);
    CHECK(config.compact_after_evictions ==
        kaku::default_compact_after_evictions);
    CHECK_FALSE(config.history_root.empty());
}
