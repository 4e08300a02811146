#include "memory/tracked_allocator.hpp"

#include <string>

namespace refpool {
namespace memory {

namespace {

bool IsValidAlignment(std::size_t alignment) {
  return alignment >= sizeof(void*) && (alignment & (alignment - 1)) == 0;
}

}  // namespace

TrackedAllocator::TrackedAllocator(const char* name, const char* backend_name)
    : name_(name),
      backend_name_(backend_name),
      alloc_count_(0),
      free_count_(0),
      alloc_fail_count_(0),
      bytes_in_use_(0),
      bytes_peak_(0) {}

TrackedAllocator::~TrackedAllocator() {}

const char* TrackedAllocator::Name() const { return name_; }
const char* TrackedAllocator::BackendName() const { return backend_name_; }
std::uint32_t TrackedAllocator::ApiVersion() const { return api::kApiVersion; }
void TrackedAllocator::Release() { delete this; }

AllocatorStats TrackedAllocator::Stats() const {
  AllocatorStats s;
  s.alloc_count = alloc_count_.load(std::memory_order_relaxed);
  s.free_count = free_count_.load(std::memory_order_relaxed);
  s.alloc_fail_count = alloc_fail_count_.load(std::memory_order_relaxed);
  s.bytes_in_use = bytes_in_use_.load(std::memory_order_relaxed);
  s.bytes_peak = bytes_peak_.load(std::memory_order_relaxed);
  return s;
}

void TrackedAllocator::ResetStats() {
  std::lock_guard<std::mutex> lock(sizes_mu_);
  std::uint64_t live = 0;
  for (std::unordered_map<void*, std::size_t>::const_iterator it = live_sizes_.begin();
       it != live_sizes_.end(); ++it) {
    live += it->second;
  }
  alloc_count_.store(0, std::memory_order_relaxed);
  free_count_.store(0, std::memory_order_relaxed);
  alloc_fail_count_.store(0, std::memory_order_relaxed);
  bytes_in_use_.store(live, std::memory_order_relaxed);
  bytes_peak_.store(live, std::memory_order_relaxed);
}

api::Result<void*> TrackedAllocator::Allocate(std::size_t size, std::size_t alignment) {
  if (size == 0) {
    alloc_fail_count_.fetch_add(1, std::memory_order_relaxed);
    return api::Result<void*>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "size must be > 0", api::ErrorModule::kMemory));
  }
  if (!IsValidAlignment(alignment)) {
    alloc_fail_count_.fetch_add(1, std::memory_order_relaxed);
    return api::Result<void*>(api::Status(api::StatusCode::kInvalidArgument,
                                          "alignment must be power-of-two and >= sizeof(void*)",
                                          api::ErrorModule::kMemory, 0x0001));
  }

  void* ptr = AllocateBlock(size, alignment);
  if (ptr == NULL) {
    alloc_fail_count_.fetch_add(1, std::memory_order_relaxed);
    return api::Result<void*>(api::Status::FromModule(
        api::StatusCode::kInternalError, std::string(BlockFunctionName()) + " failed",
        api::ErrorModule::kMemory));
  }
  NoteAllocated(ptr, size);
  return api::Result<void*>(ptr);
}

api::Status TrackedAllocator::Deallocate(void* ptr) {
  if (ptr == NULL) return api::Status::Ok();
  NoteFreed(ptr);
  FreeBlock(ptr);
  return api::Status::Ok();
}

void TrackedAllocator::NoteAllocated(void* ptr, std::size_t size) {
  std::uint64_t now = 0;
  {
    std::lock_guard<std::mutex> lock(sizes_mu_);
    live_sizes_[ptr] = size;
    now = bytes_in_use_.fetch_add(size, std::memory_order_relaxed) + size;
  }
  alloc_count_.fetch_add(1, std::memory_order_relaxed);
  std::uint64_t peak = bytes_peak_.load(std::memory_order_relaxed);
  while (now > peak && !bytes_peak_.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
  }
}

void TrackedAllocator::NoteFreed(void* ptr) {
  {
    std::lock_guard<std::mutex> lock(sizes_mu_);
    std::unordered_map<void*, std::size_t>::iterator it = live_sizes_.find(ptr);
    if (it != live_sizes_.end()) {
      bytes_in_use_.fetch_sub(it->second, std::memory_order_relaxed);
      live_sizes_.erase(it);
    }
  }
  free_count_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace memory
}  // namespace refpool
