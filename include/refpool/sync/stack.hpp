#pragma once

#include <cstddef>
#include <vector>

#include "refpool/memory/global_stl_allocator.hpp"

namespace refpool {
namespace sync {

// Single-threaded free-list. The capacity passed in is only a reserve hint;
// the owning pool decides when the list counts as full.
template <typename T>
class UnsyncStack {
 public:
  explicit UnsyncStack(std::size_t capacity) { items_.reserve(capacity); }

  bool Push(const T& value) {
    items_.push_back(value);
    return true;
  }

  bool Pop(T* out) {
    if (items_.empty()) return false;
    *out = items_.back();
    items_.pop_back();
    return true;
  }

  std::size_t Size() const { return items_.size(); }

 private:
  UnsyncStack(const UnsyncStack&);
  UnsyncStack& operator=(const UnsyncStack&);

  std::vector<T, memory::GlobalStlAllocator<T> > items_;
};

}  // namespace sync
}  // namespace refpool
