#include "refpool/pool/slot_allocator.hpp"

#include <glog/logging.h>

#include "refpool/memory/i_global_allocator.hpp"

namespace refpool {
namespace pool {
namespace detail {

void* AllocateSlot(std::size_t size, std::size_t alignment) {
  const std::size_t normalized = alignment < sizeof(void*) ? sizeof(void*) : alignment;
  api::Result<void*> r = memory::GlobalAllocator::Allocate(size, normalized);
  if (!r.ok() || r.value() == NULL) {
    LOG(FATAL) << "pool slot allocation failed (size=" << size << ", alignment=" << normalized
               << "): " << r.status().ToString();
  }
  return r.value();
}

void DeallocateSlot(void* slot) {
  api::Status st = memory::GlobalAllocator::Deallocate(slot);
  if (!st.ok()) {
    LOG(ERROR) << "pool slot deallocation failed: " << st.ToString();
  }
}

void CheckCastLayout(std::size_t from_size, std::size_t from_align, std::size_t to_size,
                     std::size_t to_align) {
  CHECK_EQ(from_size, to_size) << "Pool::Cast requires types of equal size";
  CHECK_GE(from_align, to_align) << "Pool::Cast cannot increase alignment";
}

void NotePoolCreated(const void* inner, std::size_t capacity, const char* backend) {
  VLOG(1) << "pool " << inner << " created, capacity=" << capacity << " backend=" << backend;
}

void NotePoolDestroyed(const void* inner, std::size_t freed_slots) {
  VLOG(1) << "pool " << inner << " destroyed, freed " << freed_slots << " idle slots";
}

void NotePoolFilled(const void* inner, std::size_t added, std::size_t size) {
  VLOG(1) << "pool " << inner << " filled with " << added << " slots, size=" << size;
}

void NoteSlotOverflow(const void* inner, std::size_t capacity) {
  VLOG(2) << "pool " << inner << " full at " << capacity << ", releasing slot to allocator";
}

}  // namespace detail
}  // namespace pool
}  // namespace refpool
