#ifndef KAKU_CONFIG_INCLUDED
#define KAKU_CONFIG_INCLUDED

#include <kaku_undo_history.hpp>

#include <cstddef>
#include <filesystem>

namespace kaku
{
#ifndef KAKU_DEFAULT_WRAP_WIDTH
#define KAKU_DEFAULT_WRAP_WIDTH 80
#endif
    constexpr size_t default_wrap_width{KAKU_DEFAULT_WRAP_WIDTH};

#ifndef KAKU_DEFAULT_TAB_WIDTH
#define KAKU_DEFAULT_TAB_WIDTH 4
#endif
    constexpr size_t default_tab_width{KAKU_DEFAULT_TAB_WIDTH};

#ifndef KAKU_DEFAULT_COMPACT_AFTER_EVICTIONS
#define KAKU_DEFAULT_COMPACT_AFTER_EVICTIONS 256
#endif
    constexpr size_t default_compact_after_evictions{
        KAKU_DEFAULT_COMPACT_AFTER_EVICTIONS};

    struct [[nodiscard]] config_t final
    {
        size_t wrap_width{default_wrap_width};
        size_t tab_width{default_tab_width};
        bool case_sensitive{false};
        bool persist_history{true};
        history_limits_t history_limits;
        // Undo log is rewritten once this many entries were evicted since
        // the last rewrite.
        size_t compact_after_evictions{default_compact_after_evictions};
        std::filesystem::path history_root;
    };

    // KAKU_HOME when set, otherwise .kaku under the user's home directory.
    [[nodiscard]] std::filesystem::path default_history_root();

    [[nodiscard]] config_t default_config();
} // namespace kaku

#endif
