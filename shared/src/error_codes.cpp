#include "holysheet/error_codes.hpp"

#include <array>

namespace holysheet
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::UnknownType, "unknown_type"},
            {ErrorCode::NotReceivable, "not_receivable"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::InvalidQuery, "invalid_query"},
            {ErrorCode::Transport, "transport"},
            {ErrorCode::Service, "service"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace holysheet
