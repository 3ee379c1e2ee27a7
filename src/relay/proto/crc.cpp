/**
 * @file crc.cpp
 * @brief Byte-range checksum helper.
 */
#include "relay/proto/crc.hpp"

namespace relay::proto {

std::uint16_t crc_calculate(std::span<const std::uint8_t> bytes, std::uint16_t crc) noexcept {
    for (auto b : bytes) crc = crc_accumulate(b, crc);
    return crc;
}

} // namespace relay::proto
