/**
 * ChatDrop - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatdrop::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    class FrameError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::uint32_t read_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header) noexcept;

    // Throws FrameError when the serialized message is larger than max_payload.
    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message, std::size_t max_payload);

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Returns nullopt while the buffer holds less than one complete frame. Throws FrameError for
    // frames announcing more than max_payload bytes and for payloads that are not JSON.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload);

} // namespace chatdrop::protocol
