#include <kaku_file.hpp>

#include <kaku_error.hpp>

#include <boost/crc.hpp>
#include <boost/scope/scope_exit.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <ios>
#include <iterator>

namespace
{
    [[nodiscard]] std::error_code last_error()
    {
        if (errno != 0)
        {
            return {errno, std::generic_category()};
        }
        return make_error_code(kaku::error_t::io_error);
    }

    [[nodiscard]] std::expected<void, std::error_code> create_parent(
        std::filesystem::path const& path)
    {
        if (!path.has_parent_path())
        {
            return {};
        }

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            spdlog::error("Can't create directory {}: {}",
                path.parent_path().string(),
                ec.message());
            return std::unexpected{ec};
        }

        return {};
    }

    [[nodiscard]] std::expected<void, std::error_code> write(
        std::filesystem::path const& path,
        std::string_view const content,
        std::ios::openmode const mode)
    {
        errno = 0;
        std::ofstream stream{path, mode | std::ios::binary};
        if (!stream.is_open())
        {
            std::error_code const ec{last_error()};
            spdlog::error("Can't open {} for writing: {}",
                path.string(),
                ec.message());
            return std::unexpected{ec};
        }

        stream.write(content.data(),
            static_cast<std::streamsize>(content.size()));
        stream.close();
        if (!stream)
        {
            std::error_code const ec{last_error()};
            spdlog::error("Can't write {}: {}", path.string(), ec.message());
            return std::unexpected{ec};
        }

        return {};
    }
} // namespace

std::expected<std::string, std::error_code> kaku::read_file(
    std::filesystem::path const& path)
{
    errno = 0;
    std::ifstream stream{path, std::ios::binary};
    if (!stream.is_open())
    {
        std::error_code const ec{last_error()};
        spdlog::debug("Can't open {} for reading: {}",
            path.string(),
            ec.message());
        return std::unexpected{ec};
    }

    std::string rv{std::istreambuf_iterator<char>{stream},
        std::istreambuf_iterator<char>{}};
    if (stream.bad())
    {
        std::error_code const ec{last_error()};
        spdlog::error("Can't read {}: {}", path.string(), ec.message());
        return std::unexpected{ec};
    }

    return rv;
}

std::expected<void, std::error_code> kaku::write_file(
    std::filesystem::path const& path,
    std::string_view const content)
{
    if (auto const parent{create_parent(path)}; !parent)
    {
        return parent;
    }

    std::filesystem::path temporary{path};
    temporary += ".tmp";

    boost::scope::scope_exit remove_temporary{[&temporary]()
        {
            std::error_code ec;
            std::filesystem::remove(temporary, ec);
        }};

    if (auto const written{write(temporary, content, std::ios::trunc)};
        !written)
    {
        return written;
    }

    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec)
    {
        spdlog::error("Can't replace {}: {}", path.string(), ec.message());
        return std::unexpected{ec};
    }
    remove_temporary.set_active(false);

    return {};
}

std::expected<void, std::error_code> kaku::append_file(
    std::filesystem::path const& path,
    std::string_view const content)
{
    return create_parent(path).and_then(
        [&path, &content]() { return write(path, content, std::ios::app); });
}

kaku::content_digest_t kaku::content_digest(std::string_view const content)
{
    boost::crc_32_type crc;
    crc.process_bytes(content.data(), content.size());
    return {static_cast<uint32_t>(crc.checksum()), content.size()};
}

std::optional<int64_t> kaku::file_timestamp(std::filesystem::path const& path)
{
    std::error_code ec;
    std::filesystem::file_time_type const time{
        std::filesystem::last_write_time(path, ec)};
    if (ec)
    {
        return std::nullopt;
    }

    auto const system_time{std::chrono::clock_cast<std::chrono::system_clock>(
        time)};
    return std::chrono::duration_cast<std::chrono::seconds>(
        system_time.time_since_epoch())
        .count();
}
