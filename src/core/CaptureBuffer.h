/**
 * @file CaptureBuffer.h
 * @brief CORE:CaptureBuffer - Radio callback to main loop handoff queue
 * @version 1.0.0
 *
 * Single-producer (radio callback) / single-consumer (main loop) ring.
 * push() never blocks and never allocates; when full the incoming item is
 * refused and counted, so existing order is never disturbed.
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace PBScan {

/**
 * @class CaptureBuffer
 * @brief Fixed-capacity SPSC ring buffer
 * @tparam T Trivially copyable item type
 * @tparam N Capacity in items
 */
template <typename T, size_t N> class CaptureBuffer {
public:
  static_assert(N > 0, "CaptureBuffer capacity must be non-zero");

  CaptureBuffer() : head_(0), tail_(0), dropped_(0), highWater_(0) {}

  /**
   * @brief Enqueue an item (producer side, callback safe)
   * @param item Item to copy in
   * @return false if the buffer was full and the item was dropped
   */
  bool push(const T &item) {
    const size_t head = head_.load(std::memory_order_relaxed);
    const size_t next = advance(head);

    if (next == tail_.load(std::memory_order_acquire)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }

    slots_[head] = item;
    head_.store(next, std::memory_order_release);

    const uint32_t used = static_cast<uint32_t>(
        sizeFrom(next, tail_.load(std::memory_order_relaxed)));
    if (used > highWater_.load(std::memory_order_relaxed)) {
      highWater_.store(used, std::memory_order_relaxed);
    }
    return true;
  }

  /**
   * @brief Dequeue the oldest item (consumer side)
   * @param out Receives the item
   * @return false if nothing was available
   */
  bool pop(T &out) {
    const size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_acquire)) {
      return false;
    }

    out = slots_[tail];
    tail_.store(advance(tail), std::memory_order_release);
    return true;
  }

  size_t size() const {
    return sizeFrom(head_.load(std::memory_order_acquire),
                    tail_.load(std::memory_order_acquire));
  }

  bool empty() const { return size() == 0; }
  static constexpr size_t capacity() { return N; }
  uint32_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  uint32_t highWater() const {
    return highWater_.load(std::memory_order_relaxed);
  }

  CaptureBuffer(const CaptureBuffer &) = delete;
  CaptureBuffer &operator=(const CaptureBuffer &) = delete;

private:
  // One spare slot distinguishes full from empty
  static constexpr size_t SLOTS = N + 1;

  static size_t advance(size_t index) {
    return (index + 1 == SLOTS) ? 0 : index + 1;
  }

  static size_t sizeFrom(size_t head, size_t tail) {
    return (head >= tail) ? head - tail : SLOTS - tail + head;
  }

  T slots_[SLOTS];
  std::atomic<size_t> head_;
  std::atomic<size_t> tail_;
  std::atomic<uint32_t> dropped_;
  std::atomic<uint32_t> highWater_;
};

} // namespace PBScan
