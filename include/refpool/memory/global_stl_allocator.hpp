#pragma once

#include <cstddef>
#include <limits>
#include <new>

#include "refpool/memory/i_global_allocator.hpp"

namespace refpool {
namespace memory {

// Standard allocator over GlobalAllocator. Free-list storage uses it so the
// bookkeeping of a pool is counted with its slots.
template <typename T>
struct GlobalStlAllocator {
  typedef T value_type;

  GlobalStlAllocator() {}
  template <typename U>
  GlobalStlAllocator(const GlobalStlAllocator<U>&) {}

  T* allocate(std::size_t n) {
    if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) throw std::bad_alloc();
    if (n == 0) return NULL;
    return static_cast<T*>(AllocateOrThrow(n * sizeof(T), alignof(T)));
  }

  void deallocate(T* p, std::size_t) { DeallocateOrLog(p); }

  template <typename U>
  struct rebind {
    typedef GlobalStlAllocator<U> other;
  };
};

template <typename T, typename U>
bool operator==(const GlobalStlAllocator<T>&, const GlobalStlAllocator<U>&) {
  return true;
}

template <typename T, typename U>
bool operator!=(const GlobalStlAllocator<T>&, const GlobalStlAllocator<U>&) {
  return false;
}

}  // namespace memory
}  // namespace refpool
