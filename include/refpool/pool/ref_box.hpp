#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include "refpool/pool/pool.hpp"
#include "refpool/pool/pool_traits.hpp"

namespace refpool {
namespace pool {
namespace detail {

// One pool slot: reference count, the owning pool, and the payload, in a
// single allocation. The payload storage is raw; whoever creates the slot
// constructs the value, and whoever drops the last reference destroys it.
template <typename A, typename S>
struct RefBox {
  typedef typename S::Counter Counter;

  explicit RefBox(const Pool<A, S>& owner) : pool(owner) {}

  Counter count;
  Pool<A, S> pool;
  typename std::aligned_storage<sizeof(A), alignof(A)>::type storage;

  static constexpr std::size_t SlotAlign() {
    return alignof(RefBox) > alignof(std::max_align_t) ? alignof(RefBox)
                                                       : alignof(std::max_align_t);
  }

  void* Storage() { return &storage; }
  A* Value() { return reinterpret_cast<A*>(&storage); }
  const A* Value() const { return reinterpret_cast<const A*>(&storage); }

  static RefBox* FromValue(const A* value) {
    char* raw = reinterpret_cast<char*>(const_cast<A*>(value));
    return reinterpret_cast<RefBox*>(raw - offsetof(RefBox, storage));
  }

  // Slot with the header constructed and the payload uninitialised.
  static RefBox* Acquire(const Pool<A, S>& owner) {
    return ::new (owner.PopSlot()) RefBox(owner);
  }

  // Payload already destroyed or moved out. The local pool handle keeps the
  // free-list alive while the header goes away.
  void ReturnToPool() {
    Pool<A, S> owner(std::move(pool));
    this->~RefBox();
    owner.ReleaseSlot(this);
  }

  // Like ReturnToPool, but the memory goes straight back to the allocator.
  void Discard() {
    this->~RefBox();
    DeallocateSlot(this);
  }

  // Last reference gone.
  void DestroyValueAndReturn() {
    Value()->~A();
    ReturnToPool();
  }

  template <typename... Args>
  static RefBox* Emplace(const Pool<A, S>& owner, Args&&... args) {
    RefBox* box = Acquire(owner);
    try {
      ::new (box->Storage()) A(std::forward<Args>(args)...);
    } catch (...) {
      box->ReturnToPool();
      throw;
    }
    box->count.Inc();
    return box;
  }

  static RefBox* MakeDefault(const Pool<A, S>& owner) {
    RefBox* box = Acquire(owner);
    try {
      PoolDefault<A>::DefaultUninit(box->Storage());
    } catch (...) {
      box->ReturnToPool();
      throw;
    }
    box->count.Inc();
    return box;
  }

  static RefBox* MakeClone(const Pool<A, S>& owner, const A& source) {
    RefBox* box = Acquire(owner);
    try {
      PoolClone<A>::CloneUninit(source, box->Storage());
    } catch (...) {
      box->ReturnToPool();
      throw;
    }
    box->count.Inc();
    return box;
  }
};

}  // namespace detail
}  // namespace pool
}  // namespace refpool
