#include "memory/system_allocator.hpp"

#include <cstdlib>

#if defined(_WIN32)
#include <malloc.h>
#endif

namespace refpool {
namespace memory {

SystemAllocator::SystemAllocator()
    : TrackedAllocator("refpool.memory.system_allocator", "system") {}

void* SystemAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
#if defined(_WIN32)
  return _aligned_malloc(size, alignment);
#else
  void* ptr = NULL;
  if (posix_memalign(&ptr, alignment, size) != 0) return NULL;
  return ptr;
#endif
}

void SystemAllocator::FreeBlock(void* ptr) {
#if defined(_WIN32)
  _aligned_free(ptr);
#else
  std::free(ptr);
#endif
}

const char* SystemAllocator::BlockFunctionName() const {
#if defined(_WIN32)
  return "_aligned_malloc";
#else
  return "posix_memalign";
#endif
}

}  // namespace memory
}  // namespace refpool
