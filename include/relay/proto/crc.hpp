#pragma once
/**
 * @file crc.hpp
 * @brief CRC-16/MCRF4XX (X.25 polynomial, no final xor) used by MAVLink frames.
 */

#include <cstdint>
#include <span>

namespace relay::proto {

/// Seed value for a fresh checksum.
inline constexpr std::uint16_t kCrcInit = 0xFFFF;

/// @brief Fold one byte into a running checksum.
constexpr std::uint16_t crc_accumulate(std::uint8_t b, std::uint16_t crc) noexcept {
    auto tmp = static_cast<std::uint8_t>(b ^ static_cast<std::uint8_t>(crc & 0xFF));
    tmp = static_cast<std::uint8_t>(tmp ^ static_cast<std::uint8_t>(tmp << 4));
    return static_cast<std::uint16_t>((crc >> 8) ^ (tmp << 8) ^ (tmp << 3) ^ (tmp >> 4));
}

/// @brief Checksum over a byte range, optionally continuing from @p crc.
std::uint16_t crc_calculate(std::span<const std::uint8_t> bytes,
                            std::uint16_t crc = kCrcInit) noexcept;

} // namespace relay::proto
