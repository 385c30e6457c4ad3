#ifndef KAKU_ERROR_INCLUDED
#define KAKU_ERROR_INCLUDED

#include <system_error>
#include <type_traits>

namespace kaku
{
    // NOLINTNEXTLINE(performance-enum-size)
    enum class error_t
    {
        none = 0,
        out_of_bounds,
        pattern_error,
        persistence_error,
        io_error,
        invalid_encoding,
        history_mismatch
    };

    [[nodiscard]] std::error_code make_error_code(error_t e);
} // namespace kaku

template<>
struct std::is_error_code_enum<kaku::error_t> : std::true_type
{
};

#endif
