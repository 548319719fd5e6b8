#pragma once

/**
 * @file mpsc_ring_buffer.hpp
 * @brief Bounded lock-free multi-producer, single-consumer queue.
 *
 * Every line source pushes from its own thread; the aggregator's processing
 * thread is the only consumer.
 *
 * Each slot holds raw storage for one T and an atomic `ready` flag:
 * - A producer claims a ticket by CAS on `_tail` (relaxed, the ticket only
 *   reserves the slot), move-constructs the value into the slot and
 *   publishes it with a release store of `ready`.
 * - The consumer acquires `ready` at `_head`, moves the value out, clears the
 *   flag and advances `_head` with release so producers see the free slot.
 *
 * Capacity is rounded up to a power of two (minimum 2) so that a ticket maps
 * to its slot with a mask.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Logmux::helpers {

#ifdef __cpp_lib_hardware_interference_size
inline constexpr size_t kCacheLineSize =
    std::hardware_destructive_interference_size;
#else
inline constexpr size_t kCacheLineSize = 64;
#endif

inline size_t round_up_capacity(size_t n) {
  size_t capacity = 2;
  while (capacity < n) {
    capacity <<= 1;
  }
  return capacity;
}

template <typename T> class MpscRingBuffer {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "a claimed slot must always be filled");

public:
  explicit MpscRingBuffer(size_t capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("MpscRingBuffer capacity cannot be zero");
    }
    _capacity = round_up_capacity(capacity);
    _mask = _capacity - 1;
    _slots = std::make_unique<Slot[]>(_capacity);
  }

  ~MpscRingBuffer() {
    // Destroy values that were published but never popped.
    const size_t tail = _tail.load(std::memory_order_acquire);
    for (size_t ticket = _head.load(std::memory_order_relaxed);
         ticket != tail; ++ticket) {
      Slot &slot = _slots[ticket & _mask];
      if (slot.ready.load(std::memory_order_acquire)) {
        slot.value()->~T();
      }
    }
  }

  MpscRingBuffer(const MpscRingBuffer &) = delete;
  MpscRingBuffer &operator=(const MpscRingBuffer &) = delete;

  size_t capacity() const { return _capacity; }

  /**
   * @brief Moves `value` into the queue if there is room.
   * @return false if the queue is full; `value` is left untouched then.
   */
  bool try_push(T &&value) {
    size_t ticket = _tail.load(std::memory_order_relaxed);
    while (true) {
      const size_t head = _head.load(std::memory_order_acquire);
      if (ticket - head >= _capacity) {
        return false;
      }
      // On failure `ticket` is reloaded with the current tail.
      if (_tail.compare_exchange_weak(ticket, ticket + 1,
                                      std::memory_order_relaxed,
                                      std::memory_order_relaxed)) {
        break;
      }
    }

    Slot &slot = _slots[ticket & _mask];
    new (slot.storage) T(std::move(value));
    slot.ready.store(true, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pops the oldest published value. Single consumer only.
   * @return false if the queue is empty or the next slot is claimed but not
   * yet published.
   */
  bool try_pop(T &out) {
    const size_t head = _head.load(std::memory_order_relaxed);
    if (head == _tail.load(std::memory_order_relaxed)) {
      return false;
    }
    Slot &slot = _slots[head & _mask];
    if (!slot.ready.load(std::memory_order_acquire)) {
      return false;
    }
    T *value = slot.value();
    out = std::move(*value);
    value->~T();
    slot.ready.store(false, std::memory_order_relaxed);
    _head.store(head + 1, std::memory_order_release);
    return true;
  }

  bool empty() const {
    return _head.load(std::memory_order_acquire) ==
           _tail.load(std::memory_order_acquire);
  }

private:
  struct Slot {
    alignas(T) unsigned char storage[sizeof(T)];
    std::atomic<bool> ready{false};

    T *value() { return std::launder(reinterpret_cast<T *>(storage)); }
  };

  alignas(kCacheLineSize) std::atomic<size_t> _head{0};
  alignas(kCacheLineSize) std::atomic<size_t> _tail{0};

  size_t _capacity = 0;
  size_t _mask = 0;
  std::unique_ptr<Slot[]> _slots;
};

} // namespace Logmux::helpers
