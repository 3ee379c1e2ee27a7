#pragma once
/**
 * @file fanout_router.hpp
 * @brief Fan-out router: copy each inbound frame into the three path queues.
 *
 * The router runs on the ingress thread and never performs I/O. Each enqueue is
 * a bounded, non-blocking ring operation; a full ring evicts its oldest frame
 * and the path's drop counter records it. A closed ring (fail-stopped sink)
 * refuses the frame and the path's rejected counter records it.
 *
 * Invariants:
 *  - One producer (this router) and one consumer (the path's worker) per queue.
 *  - Per-path FIFO; no ordering between paths.
 */

#include <array>
#include <cstddef>
#include <memory>

#include "relay/compat/expected.hpp"
#include "relay/mem/raw_frame.hpp"
#include "relay/mem/ring_queue.hpp"
#include "relay/obs/observability.hpp"
#include "relay/pipeline/path.hpp"

namespace relay::pipeline {

using FrameQueue = mem::RingQueue<mem::RawFrame>;
using FrameQueuePtr = std::shared_ptr<FrameQueue>;

class FanOutRouter {
public:
    /**
     * @brief Build one queue per path with @p capacity slots each.
     * @param capacity Pending frames per path.
     * @param counters Counters updated on every dispatch (must outlive the router).
     */
    static relay_detail::expected<FanOutRouter, mem::QueueError>
    create(std::size_t capacity, obs::RelayCounters& counters);

    /**
     * @brief Enqueue @p frame on every path.
     * @details Copies into the first paths and moves into the last.
     */
    void dispatch(mem::RawFrame frame);

    /// Queue of @p p (shared with the path's worker).
    const FrameQueuePtr& queue(Path p) const noexcept { return queues_[index_of(p)]; }

    /// Close every queue (no further frames are admitted).
    void close_all() noexcept;

private:
    FanOutRouter(std::array<FrameQueuePtr, kPathCount> queues, obs::RelayCounters& counters) noexcept
        : queues_(std::move(queues)), counters_(&counters) {}

    void enqueue(Path p, mem::RawFrame&& frame) noexcept;

    std::array<FrameQueuePtr, kPathCount> queues_;
    obs::RelayCounters*                   counters_;
};

} // namespace relay::pipeline
