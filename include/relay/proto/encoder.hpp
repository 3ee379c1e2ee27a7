#pragma once
/**
 * @file encoder.hpp
 * @brief Frame builder for tools and tests (the relay itself never re-encodes).
 */

#include <bit>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "relay/proto/catalogue.hpp"

namespace relay::proto {

/** @struct FrameFields
 *  @brief Header values the sender controls.
 */
struct FrameFields {
    std::uint8_t  seq{0};
    std::uint8_t  system_id{1};
    std::uint8_t  component_id{1};
    std::uint32_t msg_id{0};
};

/**
 * @class PayloadWriter
 * @brief Appends little-endian values in wire order.
 */
class PayloadWriter {
public:
    template <class T>
    PayloadWriter& put(T v) {
        static_assert(std::is_arithmetic_v<T>, "PayloadWriter::put takes arithmetic types");
        if constexpr (std::is_floating_point_v<T>) {
            using U = std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>;
            return put(std::bit_cast<U>(v));
        } else {
            auto u = static_cast<std::make_unsigned_t<T>>(v);
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                buf_.push_back(static_cast<std::uint8_t>(u & 0xFF));
                if constexpr (sizeof(T) > 1) u = static_cast<decltype(u)>(u >> 8);
            }
            return *this;
        }
    }

    /// Fixed-width char[n] field, NUL padded.
    PayloadWriter& put_chars(std::string_view s, std::size_t n);

    const std::vector<std::uint8_t>& bytes() const noexcept { return buf_; }

private:
    std::vector<std::uint8_t> buf_;
};

/// @brief Build a v1 frame (payload copied verbatim).
std::vector<std::uint8_t> encode_v1(const FrameFields& h, std::span<const std::uint8_t> payload,
                                    std::uint8_t crc_extra);

/// @brief Build an unsigned v2 frame (trailing zero payload bytes are trimmed).
std::vector<std::uint8_t> encode_v2(const FrameFields& h, std::span<const std::uint8_t> payload,
                                    std::uint8_t crc_extra);

/// @brief Build a v2 frame for a catalogue message (msg_id and CRC_EXTRA taken from @p spec).
std::vector<std::uint8_t> encode_v2(const MessageSpec& spec, FrameFields h,
                                    std::span<const std::uint8_t> payload);

/** @struct Heartbeat
 *  @brief HEARTBEAT (id 0) payload values.
 */
struct Heartbeat {
    std::uint32_t custom_mode{0};
    std::uint8_t  type{2};            ///< MAV_TYPE_QUADROTOR
    std::uint8_t  autopilot{12};      ///< MAV_AUTOPILOT_PX4
    std::uint8_t  base_mode{0};
    std::uint8_t  system_status{4};   ///< MAV_STATE_ACTIVE
    std::uint8_t  mavlink_version{3};
};

/// @brief Serialize @p hb into its 9-byte payload.
std::vector<std::uint8_t> heartbeat_payload(const Heartbeat& hb);

} // namespace relay::proto
