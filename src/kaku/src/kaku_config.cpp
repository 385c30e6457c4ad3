#include <kaku_config.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace
{
    [[nodiscard]] char const* non_empty_env(char const* const name)
    {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        char const* const value{std::getenv(name)};
        return value != nullptr && *value != '\0' ? value : nullptr;
    }
} // namespace

std::filesystem::path kaku::default_history_root()
{
    if (char const* const home{non_empty_env("KAKU_HOME")})
    {
        return home;
    }

    if (char const* const home{non_empty_env("HOME")})
    {
        return std::filesystem::path{home} / ".kaku";
    }

    spdlog::warn("HOME is not set, keeping history in the working directory");
    return ".kaku";
}

kaku::config_t kaku::default_config()
{
    config_t rv;
    rv.history_root = default_history_root();
    return rv;
}
