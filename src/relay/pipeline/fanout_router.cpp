/**
 * @file fanout_router.cpp
 * @brief Per-path enqueue with drop-oldest accounting.
 */
#include "relay/pipeline/fanout_router.hpp"

namespace relay::pipeline {

relay_detail::expected<FanOutRouter, mem::QueueError>
FanOutRouter::create(std::size_t capacity, obs::RelayCounters& counters) {
    std::array<FrameQueuePtr, kPathCount> queues;
    for (auto p : kAllPaths) {
        auto q = FrameQueue::with_capacity(capacity);
        if (!q) return relay_detail::unexpected(q.error());
        queues[index_of(p)] = std::make_shared<FrameQueue>(std::move(*q));
    }
    return FanOutRouter(std::move(queues), counters);
}

void FanOutRouter::dispatch(mem::RawFrame frame) {
    enqueue(Path::Publish, mem::RawFrame(frame));
    enqueue(Path::Archive, mem::RawFrame(frame));
    enqueue(Path::Jsonl, std::move(frame));
}

void FanOutRouter::enqueue(Path p, mem::RawFrame&& frame) noexcept {
    auto& c = counters_->path(p);
    switch (queues_[index_of(p)]->push(std::move(frame))) {
        case mem::PushResult::Accepted:
            c.enqueued.fetch_add(1, std::memory_order_relaxed);
            break;
        case mem::PushResult::DroppedOldest:
            c.enqueued.fetch_add(1, std::memory_order_relaxed);
            c.dropped.fetch_add(1, std::memory_order_relaxed);
            break;
        case mem::PushResult::Closed:
            c.rejected.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

void FanOutRouter::close_all() noexcept {
    for (const auto& q : queues_) q->close();
}

} // namespace relay::pipeline
