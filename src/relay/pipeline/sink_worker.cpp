/**
 * @file sink_worker.cpp
 * @brief Drain loop, flush policy, fail-stop and bounded shutdown.
 */
#include "relay/pipeline/sink_worker.hpp"

#include <algorithm>

#include "relay/config/constants.hpp"
#include "relay/obs/log.hpp"

namespace relay::pipeline {

using std::chrono::milliseconds;

SinkWorker::SinkWorker(Path path, FrameQueuePtr queue, std::unique_ptr<sink::FrameSink> sink,
                       FlushPolicy flush, obs::PathCounters& counters, os::RtConfig rt)
    : path_(path), queue_(std::move(queue)), sink_(std::move(sink)), flush_(flush),
      counters_(counters), rt_(std::move(rt)) {}

SinkWorker::~SinkWorker() {
    if (thread_.joinable()) {
        request_stop(clock::now());
        thread_.join();
    }
}

void SinkWorker::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread([this] { run(); });
}

void SinkWorker::request_stop(clock::time_point deadline) noexcept {
    deadline_.store(deadline.time_since_epoch().count(), std::memory_order_release);
    queue_->close();
}

void SinkWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
        return;
    }
    // Never started: nothing drained the queue.
    const auto left = queue_->clear();
    counters_.discarded.fetch_add(left, std::memory_order_relaxed);
    sink_->close();
}

void SinkWorker::stop(milliseconds grace) {
    request_stop(clock::now() + grace);
    join();
}

bool SinkWorker::past_deadline() const noexcept {
    return clock::now().time_since_epoch().count() >= deadline_.load(std::memory_order_acquire);
}

void SinkWorker::fail_stop(const char* op) {
    counters_.failed.fetch_add(1, std::memory_order_relaxed);
    failed_.store(true, std::memory_order_release);
    queue_->close();
    const auto pending = queue_->clear();
    counters_.rejected.fetch_add(pending, std::memory_order_relaxed);
    obs::log().error("{}: {} failed on {}; path stopped, {} pending frames discarded",
                     to_string(path_), op, sink_->describe(), pending);
}

void SinkWorker::run() {
    if (!os::bind_and_prioritize(rt_)) {
        obs::log().debug("{}: thread placement not fully applied (cpu={}, priority={})",
                         to_string(path_), rt_.cpu, rt_.priority);
    }
    obs::log().info("{}: worker started -> {}", to_string(path_), sink_->describe());

    const milliseconds poll{config::constants::WORKER_POLL_MS};
    const milliseconds wait = std::min(poll, flush_.interval);
    auto          last_flush = clock::now();
    std::uint32_t pending    = 0;
    mem::RawFrame frame;

    while (!failed()) {
        if (past_deadline()) {
            const auto left = queue_->clear();
            if (left != 0) {
                counters_.discarded.fetch_add(left, std::memory_order_relaxed);
                obs::log().warn("{}: shutdown grace expired, {} frames discarded", to_string(path_), left);
            }
            break;
        }

        if (queue_->pop_wait(frame, wait)) {
            if (sink_->write(frame) == sink::SinkStatus::Failed) {
                fail_stop("write");
                break;
            }
            counters_.processed.fetch_add(1, std::memory_order_relaxed);
            ++pending;
        } else if (queue_->closed() && queue_->empty()) {
            break;
        }

        const auto now = clock::now();
        if (pending != 0 && (pending >= flush_.every_records || now - last_flush >= flush_.interval)) {
            if (sink_->flush() == sink::SinkStatus::Failed) {
                fail_stop("flush");
                break;
            }
            pending    = 0;
            last_flush = now;
        }
    }

    if (!failed() && pending != 0 && sink_->flush() == sink::SinkStatus::Failed) {
        fail_stop("final flush");
    }
    sink_->close();
    obs::log().info("{}: worker stopped", to_string(path_));
}

} // namespace relay::pipeline
