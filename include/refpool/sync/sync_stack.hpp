#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <type_traits>
#include <vector>

#include "refpool/memory/global_stl_allocator.hpp"

namespace refpool {
namespace sync {
namespace detail {

inline void SpinPause(unsigned* spins) {
  if ((++*spins & 0xFFu) == 0u) {
    std::this_thread::yield();
  }
}

}  // namespace detail

// Fixed-capacity lock-free stack of non-null pointers.
//
// The size counter hands out indices. A pusher that reserved index i waits
// until cell i is empty before storing, and a popper that reserved index i
// waits until cell i holds a value before taking it, so a push and a pop that
// race on the same index never lose or duplicate a value.
template <typename T>
class SyncStack {
 public:
  static_assert(std::is_pointer<T>::value, "SyncStack<T> stores pointers only");

  explicit SyncStack(std::size_t capacity) : capacity_(capacity), size_(0), cells_(capacity) {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
      cells_[i].store(NULL, std::memory_order_relaxed);
    }
  }

  // Returns false when the stack is full. |value| must not be null.
  bool Push(T value) {
    std::size_t size = size_.load(std::memory_order_relaxed);
    unsigned spins = 0;
    for (;;) {
      if (size >= capacity_) return false;
      if (size_.compare_exchange_weak(size, size + 1, std::memory_order_acq_rel,
                                      std::memory_order_relaxed)) {
        break;
      }
      detail::SpinPause(&spins);
    }

    std::atomic<T>& cell = cells_[size];
    for (;;) {
      T expected = NULL;
      if (cell.compare_exchange_weak(expected, value, std::memory_order_release,
                                     std::memory_order_relaxed)) {
        return true;
      }
      detail::SpinPause(&spins);
    }
  }

  bool Pop(T* out) {
    std::size_t size = size_.load(std::memory_order_acquire);
    unsigned spins = 0;
    for (;;) {
      if (size == 0) return false;
      if (size_.compare_exchange_weak(size, size - 1, std::memory_order_acq_rel,
                                      std::memory_order_acquire)) {
        break;
      }
      detail::SpinPause(&spins);
    }

    std::atomic<T>& cell = cells_[size - 1];
    for (;;) {
      T value = cell.load(std::memory_order_acquire);
      if (value != NULL &&
          cell.compare_exchange_weak(value, static_cast<T>(NULL), std::memory_order_acquire,
                                     std::memory_order_relaxed)) {
        *out = value;
        return true;
      }
      detail::SpinPause(&spins);
    }
  }

  std::size_t Size() const { return size_.load(std::memory_order_acquire); }

  std::size_t Capacity() const { return capacity_; }

 private:
  SyncStack(const SyncStack&);
  SyncStack& operator=(const SyncStack&);

  const std::size_t capacity_;
  std::atomic<std::size_t> size_;
  std::vector<std::atomic<T>, memory::GlobalStlAllocator<std::atomic<T> > > cells_;
};

}  // namespace sync
}  // namespace refpool
