#pragma once
/**
 * @file sink_worker.hpp
 * @brief One consumer thread per path: drain the path queue into its sink.
 *
 * Lifecycle:
 *  - start() spawns the thread (named and pinned per RtConfig).
 *  - request_stop(deadline) closes the queue; the worker drains what is left
 *    until the deadline, then discards the rest (counted as discarded).
 *  - join() waits for the thread; the sink is closed on the worker thread.
 *
 * Fail-stop: the first write/flush failure logs one error, closes the queue,
 * discards everything pending (counted as rejected) and ends the worker.
 * Other paths are unaffected.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "relay/obs/observability.hpp"
#include "relay/os/rt.hpp"
#include "relay/pipeline/fanout_router.hpp"
#include "relay/pipeline/path.hpp"
#include "relay/sink/frame_sink.hpp"

namespace relay::pipeline {

/// @brief When a worker pushes buffered records to the OS.
struct FlushPolicy {
    std::chrono::milliseconds interval{1000};  ///< Flush at least this often while records are pending
    std::uint32_t             every_records{100};  ///< ...or after this many records
};

class SinkWorker {
public:
    using clock = std::chrono::steady_clock;

    SinkWorker(Path path, FrameQueuePtr queue, std::unique_ptr<sink::FrameSink> sink,
               FlushPolicy flush, obs::PathCounters& counters, os::RtConfig rt);
    ~SinkWorker();

    SinkWorker(const SinkWorker&)            = delete;
    SinkWorker& operator=(const SinkWorker&) = delete;

    /// Spawn the worker thread. No-op if already started.
    void start();

    /// Close the queue and let the worker drain until @p deadline.
    void request_stop(clock::time_point deadline) noexcept;

    /// Wait for the worker to finish (closes the sink if the worker never ran).
    void join();

    /// request_stop(now + grace) followed by join().
    void stop(std::chrono::milliseconds grace);

    /// True once the sink failed and the path stopped.
    bool failed() const noexcept { return failed_.load(std::memory_order_acquire); }

    Path path() const noexcept { return path_; }

private:
    void run();
    void fail_stop(const char* op);
    bool past_deadline() const noexcept;

    Path                              path_;
    FrameQueuePtr                     queue_;
    std::unique_ptr<sink::FrameSink>  sink_;
    FlushPolicy                       flush_;
    obs::PathCounters&                counters_;
    os::RtConfig                      rt_;

    std::thread                       thread_;
    std::atomic<bool>                 failed_{false};
    std::atomic<clock::rep>           deadline_{clock::time_point::max().time_since_epoch().count()};
};

} // namespace relay::pipeline
