#include "refpool/memory/i_global_allocator.hpp"

#include <memory>
#include <mutex>
#include <new>
#include <string>

#include <glog/logging.h>

#include "refpool/json/i_json.hpp"
#include "memory/allocator_factory.hpp"
#include "memory/system_allocator.hpp"
#if defined(REFPOOL_ENABLE_MIMALLOC_BACKEND)
#include "memory/mimalloc_allocator.hpp"
#endif
#if defined(REFPOOL_ENABLE_TBBMALLOC_BACKEND)
#include "memory/tbb_allocator.hpp"
#endif

namespace refpool {
namespace memory {

namespace {

struct BackendEntry {
  AllocBackend backend;
  const char* name;
  // Extra spellings accepted in config files, NULL-terminated.
  const char* aliases[3];
  bool compiled_in;
};

const BackendEntry kBackends[] = {
    {AllocBackend::kSystem, "system", {NULL, NULL, NULL}, true},
    {AllocBackend::kTbbScalable, "tbb", {"tbb_scalable", "tbbscalable", NULL},
#if defined(REFPOOL_ENABLE_TBBMALLOC_BACKEND)
     true},
#else
     false},
#endif
    {AllocBackend::kMimalloc, "mimalloc", {"mi", NULL, NULL},
#if defined(REFPOOL_ENABLE_MIMALLOC_BACKEND)
     true},
#else
     false},
#endif
};

const BackendEntry* FindBackend(AllocBackend backend) {
  for (std::size_t i = 0; i < sizeof(kBackends) / sizeof(kBackends[0]); ++i) {
    if (kBackends[i].backend == backend) return &kBackends[i];
  }
  return NULL;
}

const BackendEntry* FindBackend(const std::string& name) {
  for (std::size_t i = 0; i < sizeof(kBackends) / sizeof(kBackends[0]); ++i) {
    if (name == kBackends[i].name) return &kBackends[i];
    for (const char* const* alias = kBackends[i].aliases; *alias != NULL; ++alias) {
      if (name == *alias) return &kBackends[i];
    }
  }
  return NULL;
}

// Leaked so pools with static storage duration can still return slots
// during process teardown.
struct Registry {
  std::mutex mu;
  std::unique_ptr<IAllocator> current;
  GlobalAllocatorOptions options;

  Registry() : current(new SystemAllocator()) {}
};

Registry& GetRegistry() {
  static Registry* registry = new Registry();
  return *registry;
}

api::Status MemoryError(api::StatusCode code, const std::string& message) {
  return api::Status::FromModule(code, message, api::ErrorModule::kMemory);
}

// Fills *options from the "memory" section (or the root object).
api::Status ReadMemorySection(const json::Json& root, GlobalAllocatorOptions* options) {
  if (!root.is_object()) {
    return MemoryError(api::StatusCode::kInvalidArgument, "root JSON must be object");
  }
  const json::Json* section = &root;
  if (root.contains("memory")) {
    section = &root["memory"];
    if (!section->is_object()) {
      return MemoryError(api::StatusCode::kInvalidArgument, "memory must be JSON object");
    }
  }

  if (section->contains("backend")) {
    const json::Json& value = (*section)["backend"];
    if (!value.is_string()) {
      return MemoryError(api::StatusCode::kInvalidArgument, "memory.backend must be string");
    }
    const BackendEntry* entry = FindBackend(value.get<std::string>());
    if (entry == NULL) {
      return MemoryError(api::StatusCode::kInvalidArgument,
                         "memory.backend is invalid: " + value.get<std::string>());
    }
    options->backend = entry->backend;
  }

  if (section->contains("strict_backend")) {
    const json::Json& value = (*section)["strict_backend"];
    if (!value.is_boolean()) {
      return MemoryError(api::StatusCode::kInvalidArgument,
                         "memory.strict_backend must be boolean");
    }
    options->strict_backend = value.get<bool>();
  }
  return api::Status::Ok();
}

}  // namespace

IAllocator* NewAllocator(AllocBackend backend) {
  switch (backend) {
#if defined(REFPOOL_ENABLE_MIMALLOC_BACKEND)
    case AllocBackend::kMimalloc:
      return new MimallocAllocator();
#endif
#if defined(REFPOOL_ENABLE_TBBMALLOC_BACKEND)
    case AllocBackend::kTbbScalable:
      return new TbbAllocator();
#endif
    case AllocBackend::kSystem:
      return new SystemAllocator();
    default:
      return NULL;
  }
}

api::Status GlobalAllocator::Configure(const GlobalAllocatorOptions& options) {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);

  GlobalAllocatorOptions applied = options;
  if (applied.backend == registry.options.backend) {
    registry.options = applied;
    return api::Status::Ok();
  }

  // Slots already handed out must go back to the allocator that produced them.
  if (registry.current->Stats().bytes_in_use != 0) {
    return api::Status(api::StatusCode::kWouldBlock,
                       "cannot switch allocator backend while memory is still in use",
                       api::ErrorModule::kMemory, 0x0001);
  }

  std::unique_ptr<IAllocator> next(NewAllocator(applied.backend));
  if (!next) {
    if (applied.strict_backend) {
      return MemoryError(api::StatusCode::kUnsupported,
                         std::string("allocator backend not enabled in this build: ") +
                             BackendDisplayName(applied.backend));
    }
    LOG(WARNING) << "allocator backend " << BackendDisplayName(applied.backend)
                 << " unavailable, falling back to system";
    applied.backend = AllocBackend::kSystem;
    if (registry.options.backend != AllocBackend::kSystem) {
      next.reset(new SystemAllocator());
    }
  }

  if (next) {
    registry.current.swap(next);
    VLOG(1) << "allocator backend switched to " << registry.current->BackendName();
  }
  registry.options = applied;
  return api::Status::Ok();
}

api::Status GlobalAllocator::ConfigureFromFile(const std::string& config_path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(config_path);
  if (!loaded.ok()) {
    return loaded.status();
  }

  GlobalAllocatorOptions options;
  {
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mu);
    options = registry.options;
  }
  api::Status st = ReadMemorySection(loaded.value(), &options);
  if (!st.ok()) {
    return st;
  }
  return Configure(options);
}

api::Result<void*> GlobalAllocator::Allocate(std::size_t size, std::size_t alignment) {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  return registry.current->Allocate(size, alignment);
}

api::Status GlobalAllocator::Deallocate(void* ptr) {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  return registry.current->Deallocate(ptr);
}

AllocBackend GlobalAllocator::CurrentBackend() {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  return registry.options.backend;
}

const char* GlobalAllocator::CurrentBackendName() {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  return registry.current->BackendName();
}

const char* GlobalAllocator::BackendDisplayName(AllocBackend backend) {
  const BackendEntry* entry = FindBackend(backend);
  return entry != NULL ? entry->name : "unknown";
}

bool GlobalAllocator::IsBackendEnabled(AllocBackend backend) {
  const BackendEntry* entry = FindBackend(backend);
  return entry != NULL && entry->compiled_in;
}

AllocatorStats GlobalAllocator::CurrentStats() {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  return registry.current->Stats();
}

void GlobalAllocator::ResetCurrentStats() {
  Registry& registry = GetRegistry();
  std::lock_guard<std::mutex> lock(registry.mu);
  registry.current->ResetStats();
}

void* AllocateOrThrow(std::size_t size, std::size_t alignment) {
  const std::size_t normalized = alignment < sizeof(void*) ? sizeof(void*) : alignment;
  api::Result<void*> r = GlobalAllocator::Allocate(size, normalized);
  if (!r.ok() || r.value() == NULL) {
    throw std::bad_alloc();
  }
  return r.value();
}

void DeallocateOrLog(void* ptr) {
  api::Status st = GlobalAllocator::Deallocate(ptr);
  if (!st.ok()) {
    LOG(ERROR) << "deallocation failed: " << st.ToString();
  }
}

}  // namespace memory
}  // namespace refpool
