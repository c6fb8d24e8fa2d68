#include "chatdrop/error_codes.hpp"

#include <array>

namespace chatdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::InvalidChunk, "invalid_chunk"},
            {ErrorCode::SizeExceeded, "size_exceeded"},
            {ErrorCode::UnknownOrClosedSession, "unknown_or_closed_session"},
            {ErrorCode::UnsupportedType, "unsupported_type"},
            {ErrorCode::StorageWriteFailed, "storage_write_failed"},
            {ErrorCode::SessionExpired, "session_expired"},
            {ErrorCode::MisusedTransport, "misused_transport"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::NoAttachment, "no_attachment"},
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

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace chatdrop
