#pragma once
/**
 * @file frame.hpp
 * @brief MAVLink v1/v2 framing constants and header view.
 *
 * v1: [0xFE][len][seq][sys][comp][msgid]                          payload [crc16]
 * v2: [0xFD][len][incompat][compat][seq][sys][comp][msgid x3 LE]  payload [crc16] [signature?]
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace relay::proto {

inline constexpr std::uint8_t  kStxV1             = 0xFE;
inline constexpr std::uint8_t  kStxV2             = 0xFD;
inline constexpr std::size_t   kHeaderLenV1       = 6;
inline constexpr std::size_t   kHeaderLenV2       = 10;
inline constexpr std::size_t   kChecksumLen       = 2;
inline constexpr std::size_t   kSignatureLen      = 13;
inline constexpr std::uint8_t  kIncompatSigned    = 0x01;
inline constexpr std::size_t   kMaxPayloadLen     = 255;
inline constexpr std::size_t   kMaxFrameLen       = kHeaderLenV2 + kMaxPayloadLen + kChecksumLen + kSignatureLen;

/**
 * @struct FrameHeader
 * @brief Parsed fixed header of one frame (no payload validation).
 */
struct FrameHeader {
    std::uint8_t  version{0};         ///< 1 or 2
    std::uint8_t  payload_len{0};     ///< Declared payload length
    std::uint8_t  incompat_flags{0};  ///< v2 only
    std::uint8_t  compat_flags{0};    ///< v2 only
    std::uint8_t  seq{0};             ///< Sender sequence, wraps at 256
    std::uint8_t  system_id{0};       ///< Source system
    std::uint8_t  component_id{0};    ///< Source component
    std::uint32_t msg_id{0};          ///< 8-bit (v1) or 24-bit (v2) message id

    /// Bytes before the payload.
    std::size_t header_len() const noexcept { return version == 1 ? kHeaderLenV1 : kHeaderLenV2; }

    /// True if a v2 signature block trails the checksum.
    bool is_signed() const noexcept { return version == 2 && (incompat_flags & kIncompatSigned) != 0; }

    /// Total frame length implied by the header.
    std::size_t frame_len() const noexcept {
        return header_len() + payload_len + kChecksumLen + (is_signed() ? kSignatureLen : 0);
    }
};

/**
 * @brief Parse the fixed header at the start of @p bytes.
 * @return std::nullopt if the start byte is not a frame marker or the header is cut short.
 */
std::optional<FrameHeader> peek_header(std::span<const std::uint8_t> bytes) noexcept;

} // namespace relay::proto
