#pragma once

#include <cstddef>
#include <functional>
#include <new>
#include <ostream>
#include <type_traits>
#include <utility>

#include "refpool/pool/pool.hpp"
#include "refpool/pool/pool_traits.hpp"
#include "refpool/pool/ref_box.hpp"

namespace refpool {
namespace pool {

template <typename A, typename S>
class PoolRef;

// Outcome of PoolRef::TryUnwrap: the payload by value when the handle was
// unique, otherwise the handle itself, still shared and untouched.
template <typename A, typename S = sync::PoolUnsync>
class TryUnwrapResult {
 public:
  TryUnwrapResult(TryUnwrapResult&& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) A(std::move(*other.ValuePtr()));
    } else {
      ref_ = std::move(other.ref_);
    }
  }

  ~TryUnwrapResult() {
    if (has_value_) ValuePtr()->~A();
  }

  bool ok() const { return has_value_; }

  // Valid only when ok().
  A& value() { return *ValuePtr(); }
  const A& value() const { return *ValuePtr(); }

  // Valid only when !ok().
  PoolRef<A, S>& ref() { return ref_; }
  PoolRef<A, S> TakeRef() { return std::move(ref_); }

 private:
  friend class PoolRef<A, S>;

  explicit TryUnwrapResult(PoolRef<A, S>&& shared) : has_value_(false), ref_(std::move(shared)) {}
  explicit TryUnwrapResult(A&& value) : has_value_(true) {
    ::new (&storage_) A(std::move(value));
  }

  TryUnwrapResult(const TryUnwrapResult&);
  TryUnwrapResult& operator=(const TryUnwrapResult&);

  A* ValuePtr() { return reinterpret_cast<A*>(&storage_); }
  const A* ValuePtr() const { return reinterpret_cast<const A*>(&storage_); }

  bool has_value_;
  typename std::aligned_storage<sizeof(A), alignof(A)>::type storage_;
  PoolRef<A, S> ref_;
};

// Reference counted pointer into a pool slot.
//
// Copying a PoolRef shares the slot and never allocates. When the last copy
// is destroyed the value is destroyed and its memory goes back to the pool it
// came from. Values are immutable while shared; see MakeMut and GetMut.
//
// A moved-from PoolRef is empty: it may be assigned to or destroyed, nothing
// else.
template <typename A, typename S = sync::PoolUnsync>
class PoolRef {
 public:
  typedef A element_type;

  PoolRef(const PoolRef& other) : handle_(other.handle_) {
    Box* box = handle_.Get();
    if (box != NULL) box->count.Inc();
  }

  PoolRef(PoolRef&& other) noexcept : handle_(other.handle_.Take()) {}

  ~PoolRef() { Drop(); }

  PoolRef& operator=(PoolRef other) {
    Box* mine = handle_.Take();
    handle_.Set(other.handle_.Take());
    other.handle_.Set(mine);
    return *this;
  }

  // Value built with PoolDefault<A>, which may skip work a plain A() would do.
  static PoolRef Default(const Pool<A, S>& pool) { return PoolRef(Box::MakeDefault(pool)); }

  static PoolRef New(const Pool<A, S>& pool, const A& value) {
    return PoolRef(Box::Emplace(pool, value));
  }

  static PoolRef New(const Pool<A, S>& pool, A&& value) {
    return PoolRef(Box::Emplace(pool, std::move(value)));
  }

  // Value built with PoolClone<A>.
  static PoolRef CloneFrom(const Pool<A, S>& pool, const A& value) {
    return PoolRef(Box::MakeClone(pool, value));
  }

  // A new, unshared slot holding a clone of |other|'s value.
  static PoolRef Cloned(const Pool<A, S>& pool, const PoolRef& other) {
    return PoolRef(Box::MakeClone(pool, *other));
  }

  // Mutable access, cloning the value into a slot from |pool| first when it
  // is shared. Other handles never see the change.
  static A& MakeMut(const Pool<A, S>& pool, PoolRef* self) {
    Box* box = self->handle_.Get();
    if (box->count.Count() > 1) {
      *self = PoolRef(Box::MakeClone(pool, *box->Value()));
      box = self->handle_.Get();
    }
    return *box->Value();
  }

  // Mutable access when |self| is the only handle, NULL otherwise.
  static A* GetMut(PoolRef* self) {
    Box* box = self->handle_.Get();
    return box->count.Count() == 1 ? box->Value() : NULL;
  }

  // Move the value out if |self| is unique. The slot memory is freed rather
  // than pooled in that case.
  static TryUnwrapResult<A, S> TryUnwrap(PoolRef&& self) {
    PoolRef consumed(std::move(self));
    Box* box = consumed.handle_.Get();
    if (box->count.Count() > 1) {
      return TryUnwrapResult<A, S>(std::move(consumed));
    }
    consumed.handle_.Take();
    TryUnwrapResult<A, S> result(std::move(*box->Value()));
    box->Value()->~A();
    box->Discard();
    return result;
  }

  // The value itself if |self| is unique, a PoolClone copy otherwise.
  static A UnwrapOrClone(PoolRef&& self) {
    PoolRef consumed(std::move(self));
    Box* box = consumed.handle_.Get();
    if (box->count.Count() > 1) {
      typename std::aligned_storage<sizeof(A), alignof(A)>::type scratch;
      PoolClone<A>::CloneUninit(*box->Value(), &scratch);
      A* cloned = reinterpret_cast<A*>(&scratch);
      A value(std::move(*cloned));
      cloned->~A();
      return value;
    }
    consumed.handle_.Take();
    A value(std::move(*box->Value()));
    box->Value()->~A();
    box->Discard();
    return value;
  }

  static bool PtrEq(const PoolRef& left, const PoolRef& right) {
    return left.handle_.Get() == right.handle_.Get();
  }

  static std::size_t StrongCount(const PoolRef& self) { return self.handle_.Get()->count.Count(); }

  // Give up the handle without changing the count. The pointer must come back
  // through FromRaw on the same PoolRef type or the slot leaks.
  static const A* IntoRaw(PoolRef&& self) { return self.handle_.Take()->Value(); }

  static PoolRef FromRaw(const A* ptr) { return PoolRef(Box::FromValue(ptr)); }

  const A& operator*() const { return *handle_.Get()->Value(); }
  const A* operator->() const { return handle_.Get()->Value(); }
  const A* get() const { return handle_.Get()->Value(); }

 private:
  friend class TryUnwrapResult<A, S>;

  typedef detail::RefBox<A, S> Box;
  typedef typename S::template Pointer<Box>::type Handle;

  PoolRef() {}

  // Takes over one reference already counted in |box|.
  explicit PoolRef(Box* box) : handle_(box) {}

  void Drop() {
    Box* box = handle_.Take();
    if (box != NULL && box->count.Dec() == 1) {
      box->DestroyValueAndReturn();
    }
  }

  Handle handle_;
};

template <typename A, typename S>
bool operator==(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return PoolRef<A, S>::PtrEq(left, right) || *left == *right;
}

template <typename A, typename S>
bool operator!=(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return !(left == right);
}

template <typename A, typename S>
bool operator<(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return *left < *right;
}

template <typename A, typename S>
bool operator<=(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return !(*right < *left);
}

template <typename A, typename S>
bool operator>(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return *right < *left;
}

template <typename A, typename S>
bool operator>=(const PoolRef<A, S>& left, const PoolRef<A, S>& right) {
  return !(*left < *right);
}

template <typename A, typename S>
std::ostream& operator<<(std::ostream& os, const PoolRef<A, S>& ref) {
  return os << *ref;
}

template <typename A>
using SyncPoolRef = PoolRef<A, sync::PoolSync>;

}  // namespace pool
}  // namespace refpool

namespace std {

template <typename A, typename S>
struct hash<refpool::pool::PoolRef<A, S> > {
  std::size_t operator()(const refpool::pool::PoolRef<A, S>& ref) const {
    return std::hash<A>()(*ref);
  }
};

}  // namespace std
