#include "refpool/api/factory.hpp"

#include "log/log_manager_adapter.hpp"
#include "memory/allocator_factory.hpp"
#include "refpool/api/version.hpp"

extern "C" {

std::uint32_t refpool_get_api_version() { return refpool::api::kApiVersion; }

refpool::log::ILogManager* refpool_create_log_manager() {
  return refpool::log::NewLogManagerAdapter();
}

void refpool_destroy_log_manager(refpool::log::ILogManager* manager) {
  if (manager != NULL) manager->Release();
}

refpool::memory::IAllocator* refpool_create_allocator() {
  return refpool::memory::NewAllocator(refpool::memory::AllocBackend::kSystem);
}

refpool::memory::IAllocator* refpool_create_allocator_v2(refpool::memory::AllocBackend backend) {
  return refpool::memory::NewAllocator(backend);
}

void refpool_destroy_allocator(refpool::memory::IAllocator* allocator) {
  if (allocator != NULL) allocator->Release();
}

}
