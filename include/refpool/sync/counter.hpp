#pragma once

#include <atomic>
#include <cstddef>

namespace refpool {
namespace sync {

// Reference counters used by pool inner state and slots. Dec() returns the
// value held before the decrement, so a result of 1 means the caller dropped
// the last reference.

class UnsyncCounter {
 public:
  UnsyncCounter() : value_(0) {}

  void Inc() { ++value_; }

  std::size_t Dec() { return value_--; }

  std::size_t Count() const { return value_; }

 private:
  UnsyncCounter(const UnsyncCounter&);
  UnsyncCounter& operator=(const UnsyncCounter&);

  std::size_t value_;
};

class AtomicCounter {
 public:
  AtomicCounter() : value_(0) {}

  // A new reference is always made from an existing one, so no ordering is
  // needed here.
  void Inc() { value_.fetch_add(1, std::memory_order_relaxed); }

  // The thread that drops the last reference must see every write made
  // through the other references before it tears the object down.
  std::size_t Dec() {
    const std::size_t prev = value_.fetch_sub(1, std::memory_order_release);
    if (prev == 1) {
      std::atomic_thread_fence(std::memory_order_acquire);
    }
    return prev;
  }

  std::size_t Count() const { return value_.load(std::memory_order_acquire); }

 private:
  AtomicCounter(const AtomicCounter&);
  AtomicCounter& operator=(const AtomicCounter&);

  std::atomic<std::size_t> value_;
};

}  // namespace sync
}  // namespace refpool
