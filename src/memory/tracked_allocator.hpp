#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "refpool/memory/iallocator.hpp"

namespace refpool {
namespace memory {

// Argument checks and statistics shared by every backend. A backend only
// supplies the raw block functions.
class TrackedAllocator : public IAllocator {
 public:
  TrackedAllocator(const char* name, const char* backend_name);
  ~TrackedAllocator() override;

  const char* Name() const override;
  const char* BackendName() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  AllocatorStats Stats() const override;
  void ResetStats() override;

  api::Result<void*> Allocate(std::size_t size, std::size_t alignment) override;
  api::Status Deallocate(void* ptr) override;

 protected:
  // Returns NULL on failure. Arguments are already validated.
  virtual void* AllocateBlock(std::size_t size, std::size_t alignment) = 0;
  virtual void FreeBlock(void* ptr) = 0;
  // Name of the underlying call, used in failure messages.
  virtual const char* BlockFunctionName() const = 0;

 private:
  TrackedAllocator(const TrackedAllocator&);
  TrackedAllocator& operator=(const TrackedAllocator&);

  void NoteAllocated(void* ptr, std::size_t size);
  void NoteFreed(void* ptr);

  const char* name_;
  const char* backend_name_;

  std::atomic<std::uint64_t> alloc_count_;
  std::atomic<std::uint64_t> free_count_;
  std::atomic<std::uint64_t> alloc_fail_count_;
  std::atomic<std::uint64_t> bytes_in_use_;
  std::atomic<std::uint64_t> bytes_peak_;

  // The block functions do not report sizes, so live blocks are remembered here.
  mutable std::mutex sizes_mu_;
  std::unordered_map<void*, std::size_t> live_sizes_;
};

}  // namespace memory
}  // namespace refpool
