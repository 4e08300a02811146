#include "memory/mimalloc_allocator.hpp"

#include <mimalloc.h>

namespace refpool {
namespace memory {

MimallocAllocator::MimallocAllocator()
    : TrackedAllocator("refpool.memory.mimalloc_allocator", "mimalloc") {}

void* MimallocAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  return mi_malloc_aligned(size, alignment);
}

// mi_free accepts blocks from any mimalloc entry point, aligned ones included.
void MimallocAllocator::FreeBlock(void* ptr) { mi_free(ptr); }

const char* MimallocAllocator::BlockFunctionName() const { return "mi_malloc_aligned"; }

}  // namespace memory
}  // namespace refpool
