#pragma once

#include "memory/tracked_allocator.hpp"

namespace refpool {
namespace memory {

class SystemAllocator : public TrackedAllocator {
 public:
  SystemAllocator();

 protected:
  void* AllocateBlock(std::size_t size, std::size_t alignment) override;
  void FreeBlock(void* ptr) override;
  const char* BlockFunctionName() const override;
};

}  // namespace memory
}  // namespace refpool
