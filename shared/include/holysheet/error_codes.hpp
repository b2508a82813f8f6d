/**
 * HolySheet - Error codes shared by the protocol, catalog and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace holysheet
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPayload = 1,
        UnknownType = 2,
        NotReceivable = 3,
        Unsupported = 4,
        NotFound = 5,
        InvalidQuery = 6,
        Transport = 7,
        Service = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace holysheet
