#pragma once

#include <cstdint>
#include <vector>

namespace relay::mem {

/**
 * @file raw_frame.hpp
 * @brief Inbound frame descriptor shared by the router and every sink path.
 *
 * A RawFrame is the unit that travels through the pipeline: the exact bytes of
 * one received datagram plus its arrival stamp. Each path gets its own copy,
 * so no frame is ever mutated after the listener produced it.
 */

/// @brief Which way the frame travelled relative to the vehicle.
enum class Direction : std::uint8_t {
  Rx = 0, ///< Vehicle -> relay (the only direction produced today)
  Tx = 1  ///< Relay -> vehicle
};

/// @brief Wire label used in the JSON Lines log ("RX"/"TX").
constexpr const char* to_string(Direction d) noexcept {
  return d == Direction::Tx ? "TX" : "RX";
}

/**
 * @brief One received datagram.
 *
 * Keep this movable and cheap to copy for typical telemetry sizes (< 300 bytes).
 */
struct RawFrame final {
  /// @brief Datagram payload, byte-for-byte as received.
  std::vector<std::uint8_t> bytes{};

  /// @brief Arrival time, microseconds since the Unix epoch (non-decreasing per listener).
  std::uint64_t timestamp_us{0};

  /// @brief Direction tag.
  Direction direction{Direction::Rx};

  bool operator==(const RawFrame&) const = default;
};

/// @brief Current wall clock in microseconds since the Unix epoch.
std::uint64_t wall_clock_us() noexcept;

/**
 * @brief Wall clock that never steps backwards.
 *
 * NTP or manual clock changes can move system_clock back; archival records
 * must stay ordered, so the stamp is clamped to the last value handed out.
 * Not thread-safe: owned by the single ingress thread.
 */
class MonotonicWallClock {
public:
  std::uint64_t now_us() noexcept;

private:
  std::uint64_t last_us_{0};
};

} // namespace relay::mem
