#pragma once

#include <cstddef>
#include <string>

#include "refpool/api/export.hpp"
#include "refpool/memory/iallocator.hpp"

namespace refpool {
namespace memory {

struct GlobalAllocatorOptions {
  AllocBackend backend = AllocBackend::kSystem;
  bool strict_backend = true;
};

// Process-wide allocation facade. Every pool slot is allocated and freed
// through it, so switching the backend changes where pool memory comes from.
class REFPOOL_API GlobalAllocator {
 public:
  // Configure global allocator policy explicitly. Switching backends is
  // refused with kWouldBlock while the current backend still has live bytes
  // (e.g. slots parked on a pool free-list).
  static api::Status Configure(const GlobalAllocatorOptions& options);

  // Load allocator policy from JSON config file.
  // Supported schema:
  // {
  //   "memory": {
  //     "backend": "system|tbb|mimalloc",
  //     "strict_backend": true|false
  //   }
  // }
  static api::Status ConfigureFromFile(const std::string& config_path);

  static api::Result<void*> Allocate(std::size_t size, std::size_t alignment);
  static api::Status Deallocate(void* ptr);

  static AllocBackend CurrentBackend();

  static const char* BackendDisplayName(AllocBackend backend);
  static bool IsBackendEnabled(AllocBackend backend);

  // Stats of the active backend; pool tests read alloc_count to see slot reuse.
  static const char* CurrentBackendName();
  static AllocatorStats CurrentStats();
  static void ResetCurrentStats();
};

// Throws std::bad_alloc when the active backend cannot satisfy the request.
// Used by GlobalStlAllocator.
REFPOOL_API void* AllocateOrThrow(std::size_t size, std::size_t alignment);

// Logs instead of returning the status; for paths that cannot report errors.
REFPOOL_API void DeallocateOrLog(void* ptr);

}  // namespace memory
}  // namespace refpool
