#include "memory/tbb_allocator.hpp"

#include <tbb/scalable_allocator.h>

namespace refpool {
namespace memory {

TbbAllocator::TbbAllocator() : TrackedAllocator("refpool.memory.tbb_allocator", "tbb") {}

void* TbbAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  return scalable_aligned_malloc(size, alignment);
}

void TbbAllocator::FreeBlock(void* ptr) { scalable_aligned_free(ptr); }

const char* TbbAllocator::BlockFunctionName() const { return "scalable_aligned_malloc"; }

}  // namespace memory
}  // namespace refpool
