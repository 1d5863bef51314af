/**
 * @file spsc_queue.hpp
 * @brief Bounded single-producer/single-consumer ring used as the session → coordinator channel.
 *
 * Each RtrSession thread owns the producer side of one ring; the coordinator thread
 * owns the consumer side of all of them. push() never blocks: a full ring refuses
 * the element and leaves it with the caller, which coalesces and retries.
 *
 * Properties:
 *  - All storage is allocated by with_capacity(); push/pop never allocate.
 *  - A popped slot is reset to T{}, so shared table snapshots are released as soon
 *    as the coordinator has consumed them.
 *  - Each side caches the other side's index and only reloads it when the ring
 *    looks full (producer) or empty (consumer).
 *
 * @tparam T Element type. Must be default-constructible and nothrow-move-assignable.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "rpkiv/compat/expected.hpp"

namespace rpkiv::mem {

/// Destructive interference size used to keep the two sides apart.
inline constexpr std::size_t kCacheLine = 64;

/// Setup-time failures of SpscQueue::with_capacity().
enum class SpscError : std::uint8_t {
  CapacityZero = 1,
  CapacityNotPowerOfTwo,
  AllocationFailed,
  ElementNotNothrowMovable
};

const char* to_string(SpscError e) noexcept;

template <class T>
inline constexpr bool kSpscElement =
    std::is_default_constructible_v<T> && std::is_nothrow_move_assignable_v<T>;

template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "SpscQueue needs lock-free size_t atomics");

public:
  using value_type = T;

  SpscQueue() noexcept = default;

  /**
   * @brief Allocate a ring of @p capacity slots (power of two). One slot stays free.
   * @return The queue, or why it could not be built.
   */
  static rpkiv_detail::expected<SpscQueue, SpscError> with_capacity(std::size_t capacity) noexcept {
    if (capacity == 0) return rpkiv_detail::unexpected(SpscError::CapacityZero);
    if ((capacity & (capacity - 1)) != 0) return rpkiv_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    if constexpr (!kSpscElement<T>) {
      return rpkiv_detail::unexpected(SpscError::ElementNotNothrowMovable);
    } else {
      SpscQueue q;
      q.slots_.reset(new (std::nothrow) T[capacity]());
      if (!q.slots_) return rpkiv_detail::unexpected(SpscError::AllocationFailed);
      q.mask_ = capacity - 1;
      return q;
    }
  }

  SpscQueue(const SpscQueue&) = delete;
  SpscQueue& operator=(const SpscQueue&) = delete;

  /// Only valid while neither side is in use.
  SpscQueue(SpscQueue&& other) noexcept { take(other); }
  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) take(other);
    return *this;
  }

  /// Producer: copy @p v in. Returns false when full.
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>) {
    std::size_t t;
    if (!reserve(t)) return false;
    slots_[t] = v;
    prod_.tail.store((t + 1) & mask_, std::memory_order_release);
    return true;
  }

  /// Producer: move @p v in. Returns false when full, leaving @p v untouched.
  bool push(T&& v) noexcept {
    std::size_t t;
    if (!reserve(t)) return false;
    slots_[t] = std::move(v);
    prod_.tail.store((t + 1) & mask_, std::memory_order_release);
    return true;
  }

  /// Consumer: move the oldest element into @p out. Returns false when empty.
  bool pop(T& out) noexcept {
    const std::size_t h = cons_.head.load(std::memory_order_relaxed);
    if (h == cons_.tail_cache) {
      cons_.tail_cache = prod_.tail.load(std::memory_order_acquire);
      if (h == cons_.tail_cache) return false;
    }
    out = std::move(slots_[h]);
    slots_[h] = T{};
    cons_.head.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  /// Consumer: pop everything currently visible, in order, into @p fn. Returns the count.
  template <class Fn>
  std::size_t drain(Fn&& fn) {
    std::size_t n = 0;
    T v{};
    while (pop(v)) {
      fn(std::move(v));
      ++n;
    }
    return n;
  }

  bool empty() const noexcept {
    return cons_.head.load(std::memory_order_acquire) == prod_.tail.load(std::memory_order_acquire);
  }

  bool full() const noexcept {
    return ((prod_.tail.load(std::memory_order_acquire) + 1) & mask_) ==
           cons_.head.load(std::memory_order_acquire);
  }

  /// Slot count; at most capacity() - 1 elements are held.
  std::size_t capacity() const noexcept { return slots_ ? mask_ + 1 : 0; }

  /// Element count; exact only when both sides are quiescent.
  std::size_t approx_size() const noexcept {
    return (prod_.tail.load(std::memory_order_acquire) - cons_.head.load(std::memory_order_acquire)) & mask_;
  }

private:
  bool reserve(std::size_t& t) noexcept {
    t = prod_.tail.load(std::memory_order_relaxed);
    const std::size_t next = (t + 1) & mask_;
    if (next == prod_.head_cache) {
      prod_.head_cache = cons_.head.load(std::memory_order_acquire);
      if (next == prod_.head_cache) return false;
    }
    return true;
  }

  void take(SpscQueue& other) noexcept {
    slots_ = std::move(other.slots_);
    mask_ = std::exchange(other.mask_, 0);
    prod_.tail.store(other.prod_.tail.load(std::memory_order_relaxed), std::memory_order_relaxed);
    prod_.head_cache = other.prod_.head_cache;
    cons_.head.store(other.cons_.head.load(std::memory_order_relaxed), std::memory_order_relaxed);
    cons_.tail_cache = other.cons_.tail_cache;
  }

  struct alignas(kCacheLine) Producer {
    std::atomic<std::size_t> tail{0};
    std::size_t head_cache{0};   ///< Last head seen by the producer
  };
  struct alignas(kCacheLine) Consumer {
    std::atomic<std::size_t> head{0};
    std::size_t tail_cache{0};   ///< Last tail seen by the consumer
  };

  Producer prod_;
  Consumer cons_;
  alignas(kCacheLine) std::unique_ptr<T[]> slots_;
  std::size_t mask_{0};
};

} // namespace rpkiv::mem
