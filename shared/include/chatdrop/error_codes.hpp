/**
 * ChatDrop - Closed error taxonomy shared by the server and its clients.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chatdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        AuthenticationRequired = 3,
        InvalidChunk = 4,
        SizeExceeded = 5,
        UnknownOrClosedSession = 6,
        UnsupportedType = 7,
        StorageWriteFailed = 8,
        SessionExpired = 9,
        MisusedTransport = 10,
        Cancelled = 11,
        NotFound = 12,
        NoAttachment = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // Reason attached to a refused frame or a failed upload.
    struct Rejection
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

} // namespace chatdrop
