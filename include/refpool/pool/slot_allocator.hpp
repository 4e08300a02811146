#pragma once

#include <cstddef>

#include "refpool/api/export.hpp"

namespace refpool {
namespace pool {
namespace detail {

// Non-template helpers shared by every Pool instantiation. They route slot
// memory through memory::GlobalAllocator and keep glog out of the public
// headers.

// Never returns NULL: allocation failure is fatal.
REFPOOL_API void* AllocateSlot(std::size_t size, std::size_t alignment);
REFPOOL_API void DeallocateSlot(void* slot);

// Aborts unless a value of one type can live in storage laid out for the other.
REFPOOL_API void CheckCastLayout(std::size_t from_size, std::size_t from_align,
                                 std::size_t to_size, std::size_t to_align);

REFPOOL_API void NotePoolCreated(const void* inner, std::size_t capacity, const char* backend);
REFPOOL_API void NotePoolDestroyed(const void* inner, std::size_t freed_slots);
REFPOOL_API void NotePoolFilled(const void* inner, std::size_t added, std::size_t size);
REFPOOL_API void NoteSlotOverflow(const void* inner, std::size_t capacity);

}  // namespace detail
}  // namespace pool
}  // namespace refpool
