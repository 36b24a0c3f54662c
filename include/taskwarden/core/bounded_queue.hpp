#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>

namespace taskwarden {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

// Fixed-size ring for many producers and one consumer. Every slot carries a
// sequence number: pos means free for the producer claiming pos, pos + 1
// means filled for the consumer at pos. push() fails rather than waits when
// the ring is full. T must be default constructible; slots are reused by
// move assignment.
template <typename T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : size_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity)),
        slots_(std::make_unique<Slot[]>(size_)) {
    for (std::size_t i = 0; i < size_; ++i) {
      slots_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  [[nodiscard]] auto push(T value) -> bool {
    auto pos = head_.load(std::memory_order_relaxed);
    while (true) {
      auto& slot = slots_[pos & (size_ - 1)];
      auto seq = slot.seq.load(std::memory_order_acquire);
      if (seq == pos) {
        if (head_.compare_exchange_weak(pos, pos + 1,
                                        std::memory_order_acq_rel,
                                        std::memory_order_relaxed)) {
          slot.value = std::move(value);
          slot.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (seq < pos) {
        return false;
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer side only.
  [[nodiscard]] auto try_pop() -> std::optional<T> {
    auto& slot = slots_[tail_ & (size_ - 1)];
    if (slot.seq.load(std::memory_order_acquire) != tail_ + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(slot.value)};
    slot.value = T{};
    slot.seq.store(tail_ + size_, std::memory_order_release);
    ++tail_;
    return out;
  }

private:
  struct Slot {
    std::atomic<std::size_t> seq{0};
    T value{};
  };

  std::size_t size_;
  std::unique_ptr<Slot[]> slots_;
  alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
  alignas(kCacheLineSize) std::size_t tail_{0};
};

}  // namespace taskwarden
