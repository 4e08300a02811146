#pragma once

#include "refpool/sync/counter.hpp"
#include "refpool/sync/pointer.hpp"
#include "refpool/sync/stack.hpp"
#include "refpool/sync/sync_stack.hpp"

namespace refpool {
namespace sync {

// Backend policies. A pool and every handle made from it share one policy,
// chosen as a template argument.

// Single-threaded: plain counters, growable free-list, raw pointers.
struct PoolUnsync {
  typedef UnsyncCounter Counter;
  template <typename T>
  struct Stack {
    typedef UnsyncStack<T> type;
  };
  template <typename T>
  struct Pointer {
    typedef RawPointer<T> type;
  };
  static const char* Name() { return "unsync"; }
};

// Thread-safe: atomic counters, fixed-capacity lock-free free-list.
struct PoolSync {
  typedef AtomicCounter Counter;
  template <typename T>
  struct Stack {
    typedef SyncStack<T> type;
  };
  template <typename T>
  struct Pointer {
    typedef AtomicPointer<T> type;
  };
  static const char* Name() { return "sync"; }
};

}  // namespace sync
}  // namespace refpool
