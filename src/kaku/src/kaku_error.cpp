#include <kaku_error.hpp>

#include <cassert>
#include <string>

namespace
{
    struct [[nodiscard]] kaku_error_category_t final : std::error_category
    {
        [[nodiscard]] char const* name() const noexcept override
        {
            return "kaku";
        }

        [[nodiscard]] std::string message(int condition) const override
        {
            switch (static_cast<kaku::error_t>(condition))
            {
            case kaku::error_t::none:
                return "none";
            case kaku::error_t::out_of_bounds:
                return "position out of bounds";
            case kaku::error_t::pattern_error:
                return "malformed search pattern";
            case kaku::error_t::persistence_error:
                return "undo history could not be stored";
            case kaku::error_t::io_error:
                return "file input/output failed";
            case kaku::error_t::invalid_encoding:
                return "text is not valid UTF-8";
            case kaku::error_t::history_mismatch:
                return "file changed since undo history was saved";
            default:
                assert(false);
                return "unrecognized kaku error";
            }
        }
    };

    kaku_error_category_t const category{};
} // namespace

std::error_code kaku::make_error_code(kaku::error_t const e)
{
    return {static_cast<int>(e), category};
}
