/**
 * LinkDrop - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON
 * document of exactly that many bytes.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkdrop::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound for a single frame payload. One upload chunk of 1 MiB is
    // roughly 1.4 MiB once base64 encoded.
    inline constexpr std::uint32_t kMaxFramePayload = 4u << 20;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Client-side decoder for a buffer holding a whole frame. Returns nothing
    // until the buffer contains the full payload. The server reads the header
    // and payload separately through decode_frame_length.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    // Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header);

} // namespace linkdrop::protocol
