#pragma once

#include <atomic>
#include <cstddef>

namespace refpool {
namespace sync {

// Holders for the pool inner pointer and the slot pointer inside handles.
// Handles are never shared between threads without external
// synchronisation, so the atomic flavour only needs relaxed accesses; it
// exists to keep the sync backend free of plain data races when a handle is
// published through a lock-free queue.

template <typename T>
class RawPointer {
 public:
  RawPointer() : ptr_(NULL) {}
  explicit RawPointer(T* ptr) : ptr_(ptr) {}
  RawPointer(const RawPointer& other) : ptr_(other.Get()) {}
  RawPointer& operator=(const RawPointer& other) {
    ptr_ = other.Get();
    return *this;
  }

  T* Get() const { return ptr_; }
  void Set(T* ptr) { ptr_ = ptr; }
  bool IsNull() const { return ptr_ == NULL; }

  // Returns the held pointer and leaves this holder null.
  T* Take() {
    T* ptr = ptr_;
    ptr_ = NULL;
    return ptr;
  }

 private:
  T* ptr_;
};

template <typename T>
class AtomicPointer {
 public:
  AtomicPointer() : ptr_(NULL) {}
  explicit AtomicPointer(T* ptr) : ptr_(ptr) {}
  AtomicPointer(const AtomicPointer& other) : ptr_(other.Get()) {}
  AtomicPointer& operator=(const AtomicPointer& other) {
    ptr_.store(other.Get(), std::memory_order_relaxed);
    return *this;
  }

  T* Get() const { return ptr_.load(std::memory_order_relaxed); }
  void Set(T* ptr) { ptr_.store(ptr, std::memory_order_relaxed); }
  bool IsNull() const { return Get() == NULL; }

  T* Take() { return ptr_.exchange(NULL, std::memory_order_relaxed); }

 private:
  std::atomic<T*> ptr_;
};

}  // namespace sync
}  // namespace refpool
