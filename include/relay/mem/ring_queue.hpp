/**
 * @file ring_queue.hpp
 * @brief Bounded drop-oldest ring queue feeding one sink path (owning).
 *
 * Design goals:
 *  - Producer never blocks on a slow consumer: a full ring evicts its oldest
 *    element to admit the new one, and reports the eviction.
 *  - One-time allocation during setup via factory; slots are reused afterwards.
 *  - Exception-free hot path (push/pop return status, never throw).
 *  - FIFO: elements leave in exactly the order they were admitted.
 *  - Closable: once closed, push is refused and the consumer drains what is left.
 *
 * Eviction touches the consumer end of the ring, so both ends take a short
 * internal lock; the critical section is a slot move plus index arithmetic.
 *
 * Construction:
 *  - Use RingQueue<T>::with_capacity(capacity) to build.
 *
 * @tparam T Element type. Must be default-constructible and nothrow-movable.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/compat/expected.hpp"  // relay_detail::expected / unexpected

namespace relay::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class QueueError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  AllocationFailed,          ///< Slot storage could not be allocated
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

/// @brief Outcome of a push.
enum class PushResult : std::uint8_t {
  Accepted = 0,   ///< Stored, nothing evicted
  DroppedOldest,  ///< Stored after evicting the oldest element
  Closed          ///< Refused: queue closed, element discarded
};

/// @brief Trait to constrain element types for exception-free moves.
template <class T>
struct RingTraits {
  static constexpr bool ok =
    std::is_default_constructible_v<T> &&
    std::is_nothrow_move_constructible_v<T> &&
    std::is_nothrow_move_assignable_v<T>;
};

/**
 * @brief Bounded drop-oldest queue, one producer and one consumer.
 *
 * @tparam T Element type.
 */
template <class T>
class RingQueue final {
public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  RingQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity Maximum number of queued elements (any positive value).
   * @return expected<RingQueue, QueueError> constructed queue or error.
   */
  static relay_detail::expected<RingQueue, QueueError>
  with_capacity(std::size_t capacity) noexcept {
    if (capacity == 0) {
      return relay_detail::unexpected(QueueError::CapacityZero);
    }
    if (!RingTraits<T>::ok) {
      return relay_detail::unexpected(QueueError::ElementNotNothrowMovable);
    }

    RingQueue q;
    try {
      q.slots_.resize(capacity);
    } catch (const std::bad_alloc&) {
      return relay_detail::unexpected(QueueError::AllocationFailed);
    } catch (const std::length_error&) {
      return relay_detail::unexpected(QueueError::AllocationFailed);
    }
    q.capacity_ = capacity;
    return q;
  }

  RingQueue(const RingQueue&)            = delete; ///< Non-copyable
  RingQueue& operator=(const RingQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (setup only; never move a queue in use).
  RingQueue(RingQueue&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment (setup only; never move a queue in use).
  RingQueue& operator=(RingQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Admit @p v, evicting the oldest element if the ring is full.
   * @param v Element to move in.
   * @return Accepted, DroppedOldest, or Closed (v is discarded).
   */
  PushResult push(T&& v) noexcept {
    PushResult res = PushResult::Accepted;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return PushResult::Closed;
      if (size_ == capacity_) {
        // Overwrite the oldest slot: it becomes the newest.
        slots_[head_] = std::move(v);
        head_ = next(head_);
        res = PushResult::DroppedOldest;
      } else {
        slots_[index_of(size_)] = std::move(v);
        ++size_;
      }
    }
    cv_.notify_one();
    return res;
  }

  /// @brief Push by const reference (copies, then moves in).
  PushResult push(const T& v) {
    T copy(v);
    return push(std::move(copy));
  }

  /**
   * @brief Pop one element without waiting.
   * @param out Destination reference to receive the element.
   * @return false if the queue is empty.
   */
  bool pop(T& out) noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return take_locked(out);
  }

  /**
   * @brief Pop one element, waiting up to @p timeout for one to arrive.
   * @return false on timeout, or when the queue is closed and empty.
   */
  template <class Rep, class Period>
  bool pop_wait(T& out, std::chrono::duration<Rep, Period> timeout) noexcept {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return size_ != 0 || closed_; });
    return take_locked(out);
  }

  /// @brief Refuse further pushes and wake a waiting consumer.
  void close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /// @brief Discard everything still queued.
  /// @return Number of elements discarded.
  std::size_t clear() noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    const auto n = size_;
    for (std::size_t i = 0; i < n; ++i) slots_[index_of(i)] = T{};
    head_ = 0;
    size_ = 0;
    return n;
  }

  /// @brief True once close() was called.
  bool closed() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  /// @brief True if queue is empty (observer).
  bool empty() const noexcept { return size() == 0; }

  /// @brief Current number of queued elements.
  std::size_t size() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return size_;
  }

  /// @brief Capacity fixed at construction.
  std::size_t capacity() const noexcept { return capacity_; }

private:
  std::size_t next(std::size_t i) const noexcept { return (i + 1 == capacity_) ? 0 : i + 1; }
  std::size_t index_of(std::size_t offset) const noexcept { return (head_ + offset) % capacity_; }

  bool take_locked(T& out) noexcept {
    if (size_ == 0) return false;
    out = std::move(slots_[head_]);
    slots_[head_] = T{};
    head_ = next(head_);
    --size_;
    return true;
  }

  /// @brief Helper to implement noexcept move (locks are fresh).
  void move_from(RingQueue&& other) noexcept {
    slots_    = std::move(other.slots_);
    capacity_ = other.capacity_;
    head_     = other.head_;
    size_     = other.size_;
    closed_   = other.closed_;
    other.capacity_ = 0;
    other.head_ = 0;
    other.size_ = 0;
  }

  // Lock and wake-up state on their own cache line, away from slot metadata.
  alignas(kCacheLine) mutable std::mutex mu_;
  std::condition_variable                cv_;

  alignas(kCacheLine) std::vector<T> slots_{};  ///< Owning slot storage
  std::size_t capacity_ = 0;                    ///< Maximum queued elements
  std::size_t head_     = 0;                    ///< Oldest element
  std::size_t size_     = 0;                    ///< Queued elements
  bool        closed_   = false;                ///< Push refused once set
};

} // namespace relay::mem
