#pragma once

#include <cstddef>
#include <cstdint>

#include "refpool/api/status.hpp"
#include "refpool/api/version.hpp"

namespace refpool {
namespace memory {

enum class AllocBackend { kSystem = 0, kTbbScalable = 1, kMimalloc = 2 };

// 计数均为分配器生命周期内的累计值（ResetStats 之后重新累计）。
struct AllocatorStats {
  std::uint64_t alloc_count = 0;
  std::uint64_t free_count = 0;
  std::uint64_t alloc_fail_count = 0;
  std::uint64_t bytes_in_use = 0;
  std::uint64_t bytes_peak = 0;
};

class IAllocator {
 public:
  virtual ~IAllocator() {}

  // 实现名称，例如 "refpool.memory.tbb_allocator"。
  virtual const char* Name() const = 0;

  // 后端短名：system / tbb / mimalloc。
  virtual const char* BackendName() const = 0;

  virtual std::uint32_t ApiVersion() const = 0;

  // 销毁实例本身，调用后指针失效。
  virtual void Release() = 0;

  // 统计快照。池内槽位复用不经过分配器，因此不会增加 alloc_count。
  virtual AllocatorStats Stats() const = 0;

  // 清零累计计数；bytes_in_use 与 bytes_peak 重置为当前存活字节数。
  virtual void ResetStats() = 0;

  // 分配 size 字节、按 alignment 对齐的内存块。
  // - size 为 0，或 alignment 不是 2 的幂或小于 sizeof(void*)：kInvalidArgument。
  // - 底层分配失败：kInternalError。
  // 线程安全。
  virtual api::Result<void*> Allocate(std::size_t size, std::size_t alignment) = 0;

  // 归还 Allocate 得到的内存块，NULL 视为 no-op。线程安全。
  virtual api::Status Deallocate(void* ptr) = 0;
};

}  // namespace memory
}  // namespace refpool
