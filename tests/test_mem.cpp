/**
 * @file test_mem.cpp
 * @brief Tests for RingQueue<T> (drop-oldest, closable) and the frame clock.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

#include "relay/mem/raw_frame.hpp"
#include "relay/mem/ring_queue.hpp"

using namespace std::chrono_literals;
using relay::mem::MonotonicWallClock;
using relay::mem::PushResult;
using relay::mem::QueueError;
using relay::mem::RawFrame;
using relay::mem::RingQueue;

// ---------- RingQueue ----------

TEST(RingQueue, WithCapacity_Validation) {
  auto bad0 = RingQueue<int>::with_capacity(0);
  ASSERT_FALSE(bad0.has_value());
  EXPECT_EQ(bad0.error(), QueueError::CapacityZero);

  // Any positive capacity works (no power-of-two requirement).
  auto ok = RingQueue<int>::with_capacity(1000);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 1000u);
  EXPECT_TRUE(ok->empty());
}

TEST(RingQueue, WithCapacity_OversizedReportsAllocationFailed) {
  const auto huge = std::numeric_limits<std::size_t>::max();
  auto frames = RingQueue<RawFrame>::with_capacity(huge);
  ASSERT_FALSE(frames);
  EXPECT_EQ(frames.error(), QueueError::AllocationFailed);

  auto ints = RingQueue<int>::with_capacity(huge);
  ASSERT_FALSE(ints);
  EXPECT_EQ(ints.error(), QueueError::AllocationFailed);
}

TEST(RingQueue, SingleThread_Fifo) {
  auto qexp = RingQueue<int>::with_capacity(4);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  for (int i = 0; i < 3; ++i) EXPECT_EQ(q.push(int{i}), PushResult::Accepted);
  int v{};
  ASSERT_TRUE(q.pop(v));
  EXPECT_EQ(v, 0);

  // wrap around
  for (int i = 10; i < 12; ++i) EXPECT_EQ(q.push(int{i}), PushResult::Accepted);
  EXPECT_EQ(q.size(), 4u);

  std::vector<int> out;
  while (q.pop(v)) out.push_back(v);
  EXPECT_EQ(out, (std::vector<int>{1, 2, 10, 11}));
  EXPECT_TRUE(q.empty());
}

/**
 * @test RingQueue_Overflow_DropsExactlyOldest
 * @brief C + M pushes with no consumer evict exactly the M oldest.
 */
TEST(RingQueue, Overflow_DropsExactlyOldest) {
  constexpr std::size_t C = 8, M = 5;
  auto qexp = RingQueue<int>::with_capacity(C);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  std::size_t dropped = 0;
  for (std::size_t i = 0; i < C + M; ++i) {
    const auto r = q.push(static_cast<int>(i));
    if (r == PushResult::DroppedOldest) ++dropped;
    else EXPECT_EQ(r, PushResult::Accepted);
  }
  EXPECT_EQ(dropped, M);
  EXPECT_EQ(q.size(), C);

  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  ASSERT_EQ(out.size(), C);
  for (std::size_t i = 0; i < C; ++i) EXPECT_EQ(out[i], static_cast<int>(M + i));
}

TEST(RingQueue, CapacityOne_KeepsNewest) {
  auto qexp = RingQueue<int>::with_capacity(1);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  EXPECT_EQ(q.push(1), PushResult::Accepted);
  EXPECT_EQ(q.push(2), PushResult::DroppedOldest);
  EXPECT_EQ(q.push(3), PushResult::DroppedOldest);
  int v{};
  ASSERT_TRUE(q.pop(v));
  EXPECT_EQ(v, 3);
  EXPECT_FALSE(q.pop(v));
}

TEST(RingQueue, Close_RefusesPush_DrainsRest) {
  auto qexp = RingQueue<int>::with_capacity(4);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  EXPECT_EQ(q.push(1), PushResult::Accepted);
  EXPECT_EQ(q.push(2), PushResult::Accepted);
  q.close();
  EXPECT_TRUE(q.closed());
  EXPECT_EQ(q.push(3), PushResult::Closed);

  int v{};
  ASSERT_TRUE(q.pop_wait(v, 10ms));
  EXPECT_EQ(v, 1);
  ASSERT_TRUE(q.pop_wait(v, 10ms));
  EXPECT_EQ(v, 2);

  // Closed and empty: returns at once instead of waiting out the timeout.
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(q.pop_wait(v, 5s));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
}

TEST(RingQueue, Clear_ReturnsDiscardedCount) {
  auto qexp = RingQueue<int>::with_capacity(4);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  for (int i = 0; i < 3; ++i) q.push(int{i});
  EXPECT_EQ(q.clear(), 3u);
  EXPECT_TRUE(q.empty());
  EXPECT_EQ(q.clear(), 0u);
}

TEST(RingQueue, PopWait_TimesOutWhenEmpty) {
  auto qexp = RingQueue<int>::with_capacity(2);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  int v{};
  EXPECT_FALSE(q.pop_wait(v, 20ms));
  EXPECT_FALSE(q.closed());
}

TEST(RingQueue, ProducerConsumer_Concurrent) {
  constexpr std::size_t CAP = 1024, N = 50000;
  auto qexp = RingQueue<std::uint32_t>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<RingQueue<std::uint32_t>>(std::move(*qexp));

  // Producer waits for room so nothing is evicted; order must be intact.
  std::thread prod([&]{
    for (std::size_t i = 0; i < N; ++i) {
      while (q->size() == q->capacity()) std::this_thread::yield();
      EXPECT_EQ(q->push(static_cast<std::uint32_t>(i)), PushResult::Accepted);
    }
    q->close();
  });
  std::vector<std::uint32_t> out; out.reserve(N);
  std::thread cons([&]{
    std::uint32_t v{};
    for (;;) {
      if (q->pop_wait(v, 10ms)) { out.push_back(v); continue; }
      if (q->closed() && q->empty()) break;
    }
  });
  prod.join(); cons.join();

  ASSERT_EQ(out.size(), N);
  for (std::size_t i = 0; i < N; ++i) EXPECT_EQ(out[i], i);
}

/**
 * @test RingQueue_Firehose_AccountsForEveryItem
 * @brief Producer never waits: delivered + evicted must equal offered, and
 *        delivered items stay in increasing order.
 */
TEST(RingQueue, Firehose_AccountsForEveryItem) {
  constexpr std::size_t CAP = 16, N = 20000;
  auto qexp = RingQueue<RawFrame>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<RingQueue<RawFrame>>(std::move(*qexp));

  std::atomic<std::size_t> evicted{0};
  std::thread prod([&]{
    for (std::size_t i = 0; i < N; ++i) {
      RawFrame f;
      f.bytes = {0xFD, static_cast<std::uint8_t>(i)};
      f.timestamp_us = i;
      if (q->push(std::move(f)) == PushResult::DroppedOldest) evicted.fetch_add(1);
    }
    q->close();
  });

  std::vector<std::uint64_t> seen;
  std::thread cons([&]{
    RawFrame f;
    for (;;) {
      if (q->pop_wait(f, 10ms)) { seen.push_back(f.timestamp_us); continue; }
      if (q->closed() && q->empty()) break;
    }
  });
  prod.join(); cons.join();

  EXPECT_EQ(seen.size() + evicted.load(), N);
  for (std::size_t i = 1; i < seen.size(); ++i) EXPECT_LT(seen[i - 1], seen[i]);
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back(), N - 1);  // newest is never the one evicted
}

// ---------- MonotonicWallClock ----------

TEST(MonotonicWallClock, NeverDecreases) {
  MonotonicWallClock clk;
  std::uint64_t prev = clk.now_us();
  EXPECT_GT(prev, 0u);
  for (int i = 0; i < 1000; ++i) {
    const auto now = clk.now_us();
    EXPECT_GE(now, prev);
    prev = now;
  }
}
