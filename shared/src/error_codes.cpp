#include "linkdrop/error_codes.hpp"

#include <array>

namespace linkdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::Unauthenticated, "unauthenticated"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Expired, "expired"},
            {ErrorCode::LimitReached, "limit_reached"},
            {ErrorCode::TooLarge, "too_large"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::Unsupported, "unsupported"},
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

} // namespace linkdrop
