/**
 * LinkDrop - Error codes shared by the core, the sessions and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace linkdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        Unauthenticated = 3,
        AuthenticationFailed = 4,
        NotFound = 5,
        Expired = 6,
        LimitReached = 7,
        TooLarge = 8,
        Conflict = 9,
        Unsupported = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Whether the code describes a condition the client caused or can act on,
    // as opposed to a server-side failure.
    constexpr bool is_client_error(ErrorCode code) noexcept
    {
        return code != ErrorCode::Ok && code != ErrorCode::InternalError;
    }

} // namespace linkdrop
