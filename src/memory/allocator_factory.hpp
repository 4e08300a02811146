#pragma once

#include "refpool/memory/iallocator.hpp"

namespace refpool {
namespace memory {

// New allocator for |backend|, or NULL when it is not compiled in.
// The caller owns the result and frees it with Release().
IAllocator* NewAllocator(AllocBackend backend);

}  // namespace memory
}  // namespace refpool
