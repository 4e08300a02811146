#pragma once

#include <cstdint>

#include "refpool/api/export.hpp"

namespace refpool {
namespace log {
class ILogManager;
}
namespace memory {
class IAllocator;
enum class AllocBackend;
}
}  // namespace refpool

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
REFPOOL_API std::uint32_t refpool_get_api_version();

// Create a log manager instance owned by the caller.
REFPOOL_API refpool::log::ILogManager* refpool_create_log_manager();

// Destroy a log manager created by refpool_create_log_manager.
REFPOOL_API void refpool_destroy_log_manager(refpool::log::ILogManager* manager);

// Create a system allocator instance owned by the caller.
REFPOOL_API refpool::memory::IAllocator* refpool_create_allocator();

// Create an allocator for a specific backend. Returns NULL when the backend
// is not compiled in.
REFPOOL_API refpool::memory::IAllocator* refpool_create_allocator_v2(
    refpool::memory::AllocBackend backend);

// Destroy an allocator created by refpool_create_allocator(_v2).
REFPOOL_API void refpool_destroy_allocator(refpool::memory::IAllocator* allocator);

}
