/**
 * @file ring_bench.cpp
 * @brief Microbenchmark for RingQueue<T> (1 producer / 1 consumer, drop-oldest).
 *
 * Two modes per payload type:
 *   1) lossless: producer backs off while the ring is full (measures push+pop cost)
 *   2) firehose: producer never waits, so a slower consumer makes it evict
 *
 * Payloads: `int` and `RawFrame` with a 64-byte body (typical telemetry size).
 * Reports: items/sec, ns per pair, and evictions for the firehose mode.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/mem/raw_frame.hpp"
#include "relay/mem/ring_queue.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;
using relay::mem::PushResult;
using relay::mem::RawFrame;
using relay::mem::RingQueue;

struct Result {
  std::string name;               // e.g., "int@1024/lossless"
  std::size_t N = 0;              // items offered by the producer
  std::size_t delivered = 0;      // items popped by the consumer
  std::size_t evicted = 0;        // DroppedOldest results
  double      seconds = 0.0;      // wall time
  double      items_per_s = 0.0;  // delivered / seconds
  double      ns_per_pair = 0.0;  // 1e9 * seconds / delivered
};

template <class T>
T make_item(std::size_t i) {
  if constexpr (std::is_same_v<T, int>) {
    return static_cast<int>(i);
  } else {
    RawFrame f;
    f.bytes.assign(64, static_cast<std::uint8_t>(i));
    f.timestamp_us = i;
    return f;
  }
}

// -----------------------------------------------------------------------------
// Core benchmark runner (template on payload type)
// -----------------------------------------------------------------------------

template <class T>
Result run_one(std::string name, std::size_t capacity, std::size_t N, bool lossless) {
  auto qexp = RingQueue<T>::with_capacity(capacity);
  if (!qexp) {
    std::cerr << "Failed to create RingQueue<" << name << "> with capacity " << capacity << "\n";
    return Result{std::move(name)};
  }
  auto q = std::make_shared<RingQueue<T>>(std::move(*qexp));

  std::barrier sync(2);
  std::size_t evicted = 0;
  std::size_t delivered = 0;
  clock::time_point t_start, t_end;

  std::thread prod([&] {
    sync.arrive_and_wait();
    for (std::size_t i = 0; i < N; ++i) {
      if (lossless) {
        while (q->size() == q->capacity()) std::this_thread::yield();
      }
      if (q->push(make_item<T>(i)) == PushResult::DroppedOldest) ++evicted;
    }
    q->close();
  });

  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    T v{};
    for (;;) {
      if (q->pop_wait(v, std::chrono::milliseconds(10))) {
        ++delivered;
        continue;
      }
      if (q->closed() && q->empty()) break;
    }
    t_end = clock::now();
  });

  prod.join();
  cons.join();

  Result r;
  r.name        = std::move(name);
  r.N           = N;
  r.delivered   = delivered;
  r.evicted     = evicted;
  r.seconds     = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  r.items_per_s = (r.seconds > 0.0) ? (static_cast<double>(delivered) / r.seconds) : 0.0;
  r.ns_per_pair = (r.items_per_s > 0.0) ? 1e9 / r.items_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(24) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  got=" << std::setw(9) << r.delivered
            << "  evicted=" << std::setw(9) << r.evicted
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  items/s=" << std::setw(12) << r.items_per_s
            << "  ns/pair=" << std::setw(10) << r.ns_per_pair
            << '\n';
}

} // namespace bench

int main() {
  using bench::print;
  using bench::run_one;
  using relay::mem::RawFrame;

  // Parameters
  constexpr std::size_t N = 500'000;   // items per run
  const std::vector<std::size_t> caps = {256, 1000};

  std::cout << "Drop-oldest ring 1P/1C microbenchmark\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto cap : caps) {
    const auto tag = "@" + std::to_string(cap);
    print(run_one<int>("int" + tag + "/lossless", cap, N, true));
    print(run_one<int>("int" + tag + "/firehose", cap, N, false));
    print(run_one<RawFrame>("frame" + tag + "/lossless", cap, N, true));
    print(run_one<RawFrame>("frame" + tag + "/firehose", cap, N, false));
  }

  std::cout << std::flush;
  return 0;
}
