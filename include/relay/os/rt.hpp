#pragma once
/**
 * @file rt.hpp
 * @brief Minimal helpers to name, pin and prioritize the *current thread*.
 * @note Linux only (pthread naming, affinity, SCHED_FIFO/RR); a no-op elsewhere.
 */

#include <cstdint>
#include <string>

namespace relay::os {

    /// @brief Real-time scheduling policy.
    /// - Fifo: fixed-priority, run-to-block.
    /// - RoundRobin: fixed-priority, time-sliced among equal priorities.
    enum class RtSchedPolicy : std::uint8_t {
        Fifo = 0,
        RoundRobin = 1
    };

    /// @brief Placement of one relay thread.
    /// @var name Thread name shown by top/ps (truncated to 15 chars).
    /// @var cpu -1 to skip pinning; otherwise CPU index to pin to.
    /// @var policy RT policy applied when priority > 0.
    /// @var priority 0 keeps the default scheduler; Linux RT range is [1..99].
    struct RtConfig {
        std::string   name;
        int           cpu = -1;
        RtSchedPolicy policy = RtSchedPolicy::Fifo;
        int           priority = 0;
    };

    /// @brief Apply name, CPU affinity and RT policy to the current thread.
    /// @return true if every requested step succeeded; false if unsupported or not permitted.
    bool bind_and_prioritize(const RtConfig&);

} // namespace relay::os
