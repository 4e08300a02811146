#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace refpool {
namespace fake {

// Drop-in stand-ins for refpool::pool::Pool, PoolRef and PoolBox that do no
// pooling at all: values live in plain std::shared_ptr / std::unique_ptr
// allocations. Code written against the pool API can switch to these to
// measure what pooling buys.

template <typename A>
class Pool {
 public:
  Pool() {}
  explicit Pool(std::size_t) {}

  std::size_t Size() const { return 0; }
  std::size_t Capacity() const { return 0; }
  bool IsFull() const { return true; }
  void Fill() const {}
  Pool Filled() const { return *this; }

  template <typename B>
  Pool<B> Cast() const {
    return Pool<B>();
  }

  std::string DebugString() const { return "FakePool"; }

  template <typename B>
  bool SamePool(const Pool<B>&) const {
    return true;
  }
};

template <typename A>
std::ostream& operator<<(std::ostream& os, const Pool<A>& pool) {
  return os << pool.DebugString();
}

namespace detail {

// Heap cell behind a fake PoolRef. While the handle is out as a raw pointer,
// |parked| holds the reference that pointer stands for.
template <typename A>
struct FakeCell {
  FakeCell() : value() {}
  template <typename Arg>
  explicit FakeCell(Arg&& arg) : value(std::forward<Arg>(arg)) {}

  A value;
  std::shared_ptr<FakeCell> parked;

  static FakeCell* FromValue(const A* value) {
    char* raw = reinterpret_cast<char*>(const_cast<A*>(value));
    return reinterpret_cast<FakeCell*>(raw - offsetof(FakeCell, value));
  }
};

}  // namespace detail

template <typename A>
class PoolRef;

template <typename A>
class TryUnwrapResult {
 public:
  bool ok() const { return ok_; }

  // Valid only when ok().
  A& value() { return ref_.cell_->value; }
  const A& value() const { return ref_.cell_->value; }

  // Valid only when !ok().
  PoolRef<A>& ref() { return ref_; }
  PoolRef<A> TakeRef() { return std::move(ref_); }

 private:
  friend class PoolRef<A>;

  TryUnwrapResult(bool ok, PoolRef<A>&& ref) : ok_(ok), ref_(std::move(ref)) {}

  bool ok_;
  PoolRef<A> ref_;
};

template <typename A>
class PoolRef {
 public:
  typedef A element_type;

  static PoolRef Default(const Pool<A>&) { return PoolRef(std::make_shared<Cell>()); }
  static PoolRef New(const Pool<A>&, const A& value) {
    return PoolRef(std::make_shared<Cell>(value));
  }
  static PoolRef New(const Pool<A>&, A&& value) {
    return PoolRef(std::make_shared<Cell>(std::move(value)));
  }
  static PoolRef CloneFrom(const Pool<A>&, const A& value) {
    return PoolRef(std::make_shared<Cell>(value));
  }
  static PoolRef Cloned(const Pool<A>&, const PoolRef& other) {
    return PoolRef(std::make_shared<Cell>(*other));
  }

  static A& MakeMut(const Pool<A>&, PoolRef* self) {
    if (self->cell_.use_count() > 1) {
      self->cell_ = std::make_shared<Cell>(self->cell_->value);
    }
    return self->cell_->value;
  }

  static A* GetMut(PoolRef* self) {
    return self->cell_.use_count() == 1 ? &self->cell_->value : NULL;
  }

  // The unique value stays in its cell; the result owns the cell.
  static TryUnwrapResult<A> TryUnwrap(PoolRef&& self) {
    PoolRef consumed(std::move(self));
    const bool unique = consumed.cell_.use_count() == 1;
    return TryUnwrapResult<A>(unique, std::move(consumed));
  }

  static A UnwrapOrClone(PoolRef&& self) {
    std::shared_ptr<Cell> cell(std::move(self.cell_));
    if (cell.use_count() > 1) return A(cell->value);
    return A(std::move(cell->value));
  }

  static bool PtrEq(const PoolRef& left, const PoolRef& right) {
    return left.cell_ == right.cell_;
  }

  static std::size_t StrongCount(const PoolRef& self) {
    return static_cast<std::size_t>(self.cell_.use_count());
  }

  static const A* IntoRaw(PoolRef&& self) {
    Cell* cell = self.cell_.get();
    cell->parked = std::move(self.cell_);
    return &cell->value;
  }

  static PoolRef FromRaw(const A* ptr) {
    Cell* cell = Cell::FromValue(ptr);
    return PoolRef(std::move(cell->parked));
  }

  const A& operator*() const { return cell_->value; }
  const A* operator->() const { return &cell_->value; }
  const A* get() const { return &cell_->value; }

 private:
  friend class TryUnwrapResult<A>;

  typedef detail::FakeCell<A> Cell;

  explicit PoolRef(std::shared_ptr<Cell> cell) : cell_(std::move(cell)) {}

  std::shared_ptr<Cell> cell_;
};

template <typename A>
bool operator==(const PoolRef<A>& left, const PoolRef<A>& right) {
  return PoolRef<A>::PtrEq(left, right) || *left == *right;
}

template <typename A>
bool operator!=(const PoolRef<A>& left, const PoolRef<A>& right) {
  return !(left == right);
}

template <typename A>
bool operator<(const PoolRef<A>& left, const PoolRef<A>& right) {
  return *left < *right;
}

template <typename A>
bool operator<=(const PoolRef<A>& left, const PoolRef<A>& right) {
  return !(*right < *left);
}

template <typename A>
bool operator>(const PoolRef<A>& left, const PoolRef<A>& right) {
  return *right < *left;
}

template <typename A>
bool operator>=(const PoolRef<A>& left, const PoolRef<A>& right) {
  return !(*left < *right);
}

template <typename A>
std::ostream& operator<<(std::ostream& os, const PoolRef<A>& ref) {
  return os << *ref;
}

template <typename A>
class PoolBox {
 public:
  typedef A element_type;

  static PoolBox Default(const Pool<A>&) { return PoolBox(std::unique_ptr<A>(new A())); }
  static PoolBox New(const Pool<A>&, const A& value) {
    return PoolBox(std::unique_ptr<A>(new A(value)));
  }
  static PoolBox New(const Pool<A>&, A&& value) {
    return PoolBox(std::unique_ptr<A>(new A(std::move(value))));
  }
  static PoolBox CloneFrom(const Pool<A>&, const A& value) {
    return PoolBox(std::unique_ptr<A>(new A(value)));
  }
  static PoolBox Cloned(const Pool<A>&, const PoolBox& other) {
    return PoolBox(std::unique_ptr<A>(new A(*other)));
  }

  static A Unwrap(PoolBox&& self) {
    std::unique_ptr<A> ptr(std::move(self.ptr_));
    return A(std::move(*ptr));
  }

  static A* IntoRaw(PoolBox&& self) { return self.ptr_.release(); }
  static PoolBox FromRaw(A* ptr) { return PoolBox(std::unique_ptr<A>(ptr)); }

  static bool PtrEq(const PoolBox& left, const PoolBox& right) { return left.ptr_ == right.ptr_; }

  A& operator*() const { return *ptr_; }
  A* operator->() const { return ptr_.get(); }
  A* get() const { return ptr_.get(); }

 private:
  explicit PoolBox(std::unique_ptr<A> ptr) : ptr_(std::move(ptr)) {}

  std::unique_ptr<A> ptr_;
};

template <typename A>
bool operator==(const PoolBox<A>& left, const PoolBox<A>& right) {
  return *left == *right;
}

template <typename A>
bool operator!=(const PoolBox<A>& left, const PoolBox<A>& right) {
  return !(*left == *right);
}

template <typename A>
bool operator<(const PoolBox<A>& left, const PoolBox<A>& right) {
  return *left < *right;
}

template <typename A>
bool operator<=(const PoolBox<A>& left, const PoolBox<A>& right) {
  return !(*right < *left);
}

template <typename A>
bool operator>(const PoolBox<A>& left, const PoolBox<A>& right) {
  return *right < *left;
}

template <typename A>
bool operator>=(const PoolBox<A>& left, const PoolBox<A>& right) {
  return !(*left < *right);
}

template <typename A>
std::ostream& operator<<(std::ostream& os, const PoolBox<A>& box) {
  return os << *box;
}

}  // namespace fake
}  // namespace refpool

namespace std {

template <typename A>
struct hash<refpool::fake::PoolRef<A> > {
  std::size_t operator()(const refpool::fake::PoolRef<A>& ref) const {
    return std::hash<A>()(*ref);
  }
};

template <typename A>
struct hash<refpool::fake::PoolBox<A> > {
  std::size_t operator()(const refpool::fake::PoolBox<A>& box) const {
    return std::hash<A>()(*box);
  }
};

}  // namespace std
