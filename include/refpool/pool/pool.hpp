#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

#include "refpool/pool/slot_allocator.hpp"
#include "refpool/sync/sync_type.hpp"

namespace refpool {
namespace pool {

namespace detail {
template <typename A, typename S>
struct RefBox;
}  // namespace detail

// State shared by every Pool handle aliasing one pool. It only stores raw
// slot addresses, so pools of different payload types with the same slot
// layout can share it (see Pool::Cast).
template <typename S>
class PoolInner {
 public:
  explicit PoolInner(std::size_t capacity) : capacity_(capacity), free_list_(capacity) {}

  ~PoolInner() {
    void* slot = NULL;
    std::size_t freed = 0;
    while (free_list_.Pop(&slot)) {
      detail::DeallocateSlot(slot);
      ++freed;
    }
    detail::NotePoolDestroyed(this, freed);
  }

  void Inc() { count_.Inc(); }
  std::size_t Dec() { return count_.Dec(); }

  std::size_t Capacity() const { return capacity_; }
  std::size_t Size() const { return free_list_.Size(); }

  bool Push(void* slot) { return free_list_.Push(slot); }
  bool Pop(void** slot) { return free_list_.Pop(slot); }

 private:
  PoolInner(const PoolInner&);
  PoolInner& operator=(const PoolInner&);

  typename S::Counter count_;
  const std::size_t capacity_;
  typename S::template Stack<void*>::type free_list_;
};

// A pool of preallocated memory slots sized for values of type A.
//
// Pool is a cheap handle: copies alias the same free-list. Values built from
// it with PoolRef/PoolBox go back onto the free-list when their last handle
// is destroyed, up to the capacity; beyond that they are freed normally.
//
// A capacity of 0 gives the null pool: nothing is allocated for the pool
// itself, and every slot is a plain allocation. Use it where you would
// otherwise need an optional pool.
template <typename A, typename S = sync::PoolUnsync>
class Pool {
 public:
  typedef A value_type;
  typedef S sync_type;

  Pool() {}

  explicit Pool(std::size_t capacity) {
    if (capacity == 0) return;
    PoolInner<S>* inner = new PoolInner<S>(capacity);
    inner->Inc();
    inner_.Set(inner);
    detail::NotePoolCreated(inner, capacity, S::Name());
  }

  Pool(const Pool& other) : inner_(other.inner_) { IncInner(); }

  Pool(Pool&& other) noexcept : inner_(other.inner_.Take()) {}

  ~Pool() { DecInner(); }

  Pool& operator=(Pool other) {
    PoolInner<S>* mine = inner_.Take();
    inner_.Set(other.inner_.Take());
    other.inner_.Set(mine);
    return *this;
  }

  // Number of idle slots on the free-list.
  std::size_t Size() const {
    PoolInner<S>* inner = inner_.Get();
    return inner == NULL ? 0 : inner->Size();
  }

  std::size_t Capacity() const {
    PoolInner<S>* inner = inner_.Get();
    return inner == NULL ? 0 : inner->Capacity();
  }

  // Always true for the null pool.
  bool IsFull() const {
    PoolInner<S>* inner = inner_.Get();
    return inner == NULL || inner->Size() >= inner->Capacity();
  }

  // Preallocate uninitialised slots until the free-list is full.
  void Fill() const;

  Pool Filled() const {
    Fill();
    return *this;
  }

  // Reuse this pool's slots for another type with the same size and no
  // stricter alignment. The returned handle shares the free-list.
  template <typename B>
  Pool<B, S> Cast() const;

  // "Pool[<size>/<capacity>]:0x<address>"
  std::string DebugString() const {
    std::ostringstream os;
    os << "Pool[" << Size() << "/" << Capacity() << "]:0x" << std::hex
       << reinterpret_cast<std::uintptr_t>(inner_.Get());
    return os.str();
  }

  template <typename B>
  bool SamePool(const Pool<B, S>& other) const {
    return inner_.Get() == other.inner_.Get();
  }

 private:
  template <typename, typename>
  friend class Pool;
  template <typename, typename>
  friend struct detail::RefBox;

  typedef typename S::template Pointer<PoolInner<S> >::type InnerPointer;

  struct AliasTag {};

  Pool(PoolInner<S>* shared, AliasTag) : inner_(shared) { IncInner(); }

  void IncInner() {
    PoolInner<S>* inner = inner_.Get();
    if (inner != NULL) inner->Inc();
  }

  void DecInner() {
    PoolInner<S>* inner = inner_.Take();
    if (inner != NULL && inner->Dec() == 1) {
      delete inner;
    }
  }

  // Raw slot memory: popped from the free-list when possible.
  void* PopSlot() const;

  // |slot| must be fully destroyed memory obtained from PopSlot() of a pool
  // sharing this inner state.
  void ReleaseSlot(void* slot) const {
    PoolInner<S>* inner = inner_.Get();
    if (inner != NULL) {
      if (inner->Size() < inner->Capacity() && inner->Push(slot)) return;
      detail::NoteSlotOverflow(inner, inner->Capacity());
    }
    detail::DeallocateSlot(slot);
  }

  InnerPointer inner_;
};

template <typename A, typename S>
std::ostream& operator<<(std::ostream& os, const Pool<A, S>& pool) {
  return os << pool.DebugString();
}

}  // namespace pool
}  // namespace refpool

// The slot layout embeds a Pool by value.
#include "refpool/pool/ref_box.hpp"

namespace refpool {
namespace pool {

template <typename A, typename S>
void Pool<A, S>::Fill() const {
  PoolInner<S>* inner = inner_.Get();
  if (inner == NULL) return;

  typedef detail::RefBox<A, S> Box;
  std::size_t added = 0;
  while (inner->Size() < inner->Capacity()) {
    void* slot = detail::AllocateSlot(sizeof(Box), Box::SlotAlign());
    if (!inner->Push(slot)) {
      // Another thread filled the last free cell first.
      detail::DeallocateSlot(slot);
      break;
    }
    ++added;
  }
  detail::NotePoolFilled(inner, added, inner->Size());
}

template <typename A, typename S>
template <typename B>
Pool<B, S> Pool<A, S>::Cast() const {
  typedef detail::RefBox<A, S> FromBox;
  typedef detail::RefBox<B, S> ToBox;
  static_assert(sizeof(FromBox) == sizeof(ToBox), "Pool::Cast requires equal slot sizes");
  static_assert(FromBox::SlotAlign() == ToBox::SlotAlign(),
                "Pool::Cast requires equal slot alignment");
  detail::CheckCastLayout(sizeof(A), alignof(A), sizeof(B), alignof(B));
  return Pool<B, S>(inner_.Get(), typename Pool<B, S>::AliasTag());
}

template <typename A, typename S>
void* Pool<A, S>::PopSlot() const {
  typedef detail::RefBox<A, S> Box;
  void* slot = NULL;
  PoolInner<S>* inner = inner_.Get();
  if (inner != NULL && inner->Pop(&slot)) return slot;
  return detail::AllocateSlot(sizeof(Box), Box::SlotAlign());
}

template <typename A>
using SyncPool = Pool<A, sync::PoolSync>;

}  // namespace pool
}  // namespace refpool
