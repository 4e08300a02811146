#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

#include "refpool/pool/pool.hpp"
#include "refpool/pool/ref_box.hpp"

namespace refpool {
namespace pool {

// Owning pointer into a pool slot, the exclusive counterpart of PoolRef.
// Move-only; use Cloned for an explicit copy.
template <typename A, typename S = sync::PoolUnsync>
class PoolBox {
 public:
  typedef A element_type;

  PoolBox(PoolBox&& other) noexcept : handle_(other.handle_.Take()) {}

  ~PoolBox() { Drop(); }

  PoolBox& operator=(PoolBox&& other) {
    if (this != &other) {
      Drop();
      handle_.Set(other.handle_.Take());
    }
    return *this;
  }

  static PoolBox Default(const Pool<A, S>& pool) { return PoolBox(Box::MakeDefault(pool)); }

  static PoolBox New(const Pool<A, S>& pool, const A& value) {
    return PoolBox(Box::Emplace(pool, value));
  }

  static PoolBox New(const Pool<A, S>& pool, A&& value) {
    return PoolBox(Box::Emplace(pool, std::move(value)));
  }

  static PoolBox CloneFrom(const Pool<A, S>& pool, const A& value) {
    return PoolBox(Box::MakeClone(pool, value));
  }

  static PoolBox Cloned(const Pool<A, S>& pool, const PoolBox& other) {
    return PoolBox(Box::MakeClone(pool, *other));
  }

  static bool PtrEq(const PoolBox& left, const PoolBox& right) {
    return left.handle_.Get() == right.handle_.Get();
  }

  // The value moved out; the slot memory is freed rather than pooled.
  static A Unwrap(PoolBox&& self) {
    Box* box = self.handle_.Take();
    A value(std::move(*box->Value()));
    box->Value()->~A();
    box->Discard();
    return value;
  }

  // Give up ownership. Hand the pointer back to FromRaw or the slot leaks.
  static A* IntoRaw(PoolBox&& self) { return self.handle_.Take()->Value(); }

  static PoolBox FromRaw(A* ptr) { return PoolBox(Box::FromValue(ptr)); }

  A& operator*() const { return *handle_.Get()->Value(); }
  A* operator->() const { return handle_.Get()->Value(); }
  A* get() const { return handle_.Get()->Value(); }

 private:
  typedef detail::RefBox<A, S> Box;
  typedef typename S::template Pointer<Box>::type Handle;

  explicit PoolBox(Box* box) : handle_(box) {}

  PoolBox(const PoolBox&);
  PoolBox& operator=(const PoolBox&);

  void Drop() {
    Box* box = handle_.Take();
    if (box != NULL) box->DestroyValueAndReturn();
  }

  Handle handle_;
};

template <typename A, typename S>
bool operator==(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return *left == *right;
}

template <typename A, typename S>
bool operator!=(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return !(*left == *right);
}

template <typename A, typename S>
bool operator<(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return *left < *right;
}

template <typename A, typename S>
bool operator<=(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return !(*right < *left);
}

template <typename A, typename S>
bool operator>(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return *right < *left;
}

template <typename A, typename S>
bool operator>=(const PoolBox<A, S>& left, const PoolBox<A, S>& right) {
  return !(*left < *right);
}

template <typename A, typename S>
std::ostream& operator<<(std::ostream& os, const PoolBox<A, S>& box) {
  return os << *box;
}

template <typename A>
using SyncPoolBox = PoolBox<A, sync::PoolSync>;

}  // namespace pool
}  // namespace refpool

namespace std {

template <typename A, typename S>
struct hash<refpool::pool::PoolBox<A, S> > {
  std::size_t operator()(const refpool::pool::PoolBox<A, S>& box) const {
    return std::hash<A>()(*box);
  }
};

}  // namespace std
