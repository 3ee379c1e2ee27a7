#pragma once
/**
 * @file observability.hpp
 * @brief Relay counters: ingress totals plus per-path queue/sink accounting.
 * @details Counters are updated lock-free from the ingress thread and the sink
 *          workers; snapshot() gives a consistent-enough copy for logging.
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <string_view>

#include "relay/pipeline/path.hpp"

namespace relay::obs {

    /** @struct PathCounters
     *  @brief Live counters of one sink path.
     */
    struct PathCounters {
        std::atomic<uint64_t> enqueued{0};   ///< Frames admitted into the path queue
        std::atomic<uint64_t> dropped{0};    ///< Oldest frames evicted on overflow
        std::atomic<uint64_t> rejected{0};   ///< Frames refused or discarded after fail-stop
        std::atomic<uint64_t> processed{0};  ///< Frames handed to the sink successfully
        std::atomic<uint64_t> failed{0};     ///< Sink write/flush failures
        std::atomic<uint64_t> discarded{0};  ///< Frames left behind when the shutdown grace ran out
    };

    /** @struct IngressCounters
     *  @brief Live counters of the receive loop.
     */
    struct IngressCounters {
        std::atomic<uint64_t> frames{0};  ///< Datagrams received
        std::atomic<uint64_t> bytes{0};   ///< Bytes received
        std::atomic<uint64_t> errors{0};  ///< Transport errors
    };

    /** @struct RelayCounters
     *  @brief Everything the relay counts, owned by the Relay.
     */
    struct RelayCounters {
        IngressCounters                                       ingress;
        std::array<PathCounters, pipeline::kPathCount>        paths;

        PathCounters&       path(pipeline::Path p) noexcept       { return paths[pipeline::index_of(p)]; }
        const PathCounters& path(pipeline::Path p) const noexcept { return paths[pipeline::index_of(p)]; }
    };

    /** @struct PathSnapshot
     *  @brief Plain copy of PathCounters.
     */
    struct PathSnapshot {
        uint64_t enqueued{0};
        uint64_t dropped{0};
        uint64_t rejected{0};
        uint64_t processed{0};
        uint64_t failed{0};
        uint64_t discarded{0};
    };

    /** @struct RelaySnapshot
     *  @brief Plain copy of RelayCounters.
     */
    struct RelaySnapshot {
        uint64_t frames{0};
        uint64_t bytes{0};
        uint64_t ingress_errors{0};
        std::array<PathSnapshot, pipeline::kPathCount> paths{};

        const PathSnapshot& path(pipeline::Path p) const noexcept { return paths[pipeline::index_of(p)]; }
    };

    /// Copy the live counters.
    RelaySnapshot snapshot(const RelayCounters& c) noexcept;

    /// Log one line per path plus the ingress totals, prefixed by @p label.
    void log_snapshot(const RelaySnapshot& s, std::string_view label);

} // namespace relay::obs
