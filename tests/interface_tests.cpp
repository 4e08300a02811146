#include "refpool/refpool.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

namespace {

std::string TempName(const char* stem) {
  const long long tick = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::string("refpool_") + stem + "_" + std::to_string(tick) + ".json";
}

void WriteFile(const std::string& path, const std::string& text) {
  std::ofstream out(path.c_str());
  out << text << "\n";
}

}  // namespace

bool TestApiVersion() { return refpool_get_api_version() == refpool::api::kApiVersion; }

bool TestFactoryLifecycle() {
  refpool::log::ILogManager* logger = refpool_create_log_manager();
  if (logger == NULL) return false;
  if (logger->ApiVersion() != refpool::api::kApiVersion) return false;
  if (logger->Init("", "").code() != refpool::api::StatusCode::kInvalidArgument) return false;
  refpool_destroy_log_manager(logger);

  refpool::memory::IAllocator* allocator = refpool_create_allocator();
  if (allocator == NULL) return false;
  if (allocator->ApiVersion() != refpool::api::kApiVersion) return false;
  if (std::string(allocator->BackendName()) != "system") return false;
  refpool_destroy_allocator(allocator);

  for (int b = 0; b < 3; ++b) {
    const refpool::memory::AllocBackend backend = static_cast<refpool::memory::AllocBackend>(b);
    refpool::memory::IAllocator* a = refpool_create_allocator_v2(backend);
    const bool enabled = refpool::memory::GlobalAllocator::IsBackendEnabled(backend);
    if ((a != NULL) != enabled) return false;
    if (a != NULL && std::string(a->BackendName()) !=
                         refpool::memory::GlobalAllocator::BackendDisplayName(backend)) {
      refpool_destroy_allocator(a);
      return false;
    }
    refpool_destroy_allocator(a);
  }
  return true;
}

bool TestAllocatorBasic() {
  refpool::memory::IAllocator* allocator = refpool_create_allocator();
  if (allocator == NULL) return false;
  refpool::api::Result<void*> alloc = allocator->Allocate(64, 16);
  if (!alloc.ok() || alloc.value() == NULL) return false;
  unsigned char* p = static_cast<unsigned char*>(alloc.value());
  for (int i = 0; i < 64; ++i) p[i] = static_cast<unsigned char>(i);
  if (allocator->Stats().bytes_in_use != 64) return false;
  refpool::api::Status st_alloc = allocator->Deallocate(alloc.value());
  if (allocator->Stats().bytes_in_use != 0) return false;

  refpool::api::Result<void*> bad = allocator->Allocate(64, 24);
  refpool_destroy_allocator(allocator);
  if (!st_alloc.ok()) return false;
  if (bad.ok()) return false;
  return bad.status().code() == refpool::api::StatusCode::kInvalidArgument;
}

bool TestErrorCatalog() {
  refpool::api::Status st(refpool::api::StatusCode::kInvalidArgument, "capacity",
                          refpool::api::ErrorModule::kPool, 0x0001);
  const refpool::api::ErrorCatalogEntry* entry = refpool::api::FindErrorCatalogEntry(st.hex_code());
  if (entry == NULL) return false;
  if (std::string(entry->symbol) != "POOL_INVALID_CAPACITY") return false;
  if (st.hex_code_string() != "0x70100001") return false;
  if (std::string(refpool::api::ErrorModuleName(refpool::api::ErrorModule::kPool)) != "pool") {
    return false;
  }
  return st.ToString().find("capacity") != std::string::npos;
}

bool TestJsonCodec() {
  refpool::api::Result<refpool::json::Json> bad = refpool::json::JsonCodec::Parse("{ nope");
  if (bad.ok() || bad.status().code() != refpool::api::StatusCode::kInvalidArgument) return false;

  refpool::api::Result<refpool::json::Json> missing =
      refpool::json::JsonCodec::LoadFile("refpool_definitely_missing.json");
  if (missing.ok() || missing.status().code() != refpool::api::StatusCode::kNotFound) return false;

  const std::string path = TempName("codec");
  refpool::json::Json doc;
  doc["pool"]["capacity"] = 16;
  if (!refpool::json::JsonCodec::SaveFile(path, doc).ok()) return false;
  refpool::api::Result<refpool::json::Json> loaded = refpool::json::JsonCodec::LoadFile(path);
  std::remove(path.c_str());
  if (!loaded.ok()) return false;
  return loaded.value()["pool"]["capacity"].get<int>() == 16;
}

bool TestGlobalAllocatorConfig() {
  const std::string ok_cfg = TempName("mem_ok");
  const std::string bad_cfg = TempName("mem_bad");
  const std::string fallback_cfg = TempName("mem_fallback");
  const std::string typo_cfg = TempName("mem_typo");

  WriteFile(ok_cfg, "{ \"memory\": { \"backend\": \"system\", \"strict_backend\": true } }");
  WriteFile(bad_cfg, "{ \"memory\": { \"backend\": \"mimalloc\", \"strict_backend\": true } }");
  WriteFile(fallback_cfg, "{ \"memory\": { \"backend\": \"mimalloc\", \"strict_backend\": false } }");
  WriteFile(typo_cfg, "{ \"memory\": { \"backend\": \"jemalloc\" } }");

  refpool::api::Status st = refpool::memory::GlobalAllocator::ConfigureFromFile(ok_cfg);
  if (!st.ok()) return false;
  if (refpool::memory::GlobalAllocator::CurrentBackend() != refpool::memory::AllocBackend::kSystem) {
    return false;
  }

  refpool::api::Result<void*> live = refpool::memory::GlobalAllocator::Allocate(256, 16);
  if (!live.ok()) return false;
  // A live allocation pins the backend.
  refpool::memory::GlobalAllocatorOptions switch_opts;
  switch_opts.backend = refpool::memory::AllocBackend::kTbbScalable;
  refpool::api::Status pinned = refpool::memory::GlobalAllocator::Configure(switch_opts);
  refpool::memory::DeallocateOrLog(live.value());
  if (refpool::memory::GlobalAllocator::IsBackendEnabled(switch_opts.backend) &&
      pinned.code() != refpool::api::StatusCode::kWouldBlock) {
    return false;
  }

  void* block = refpool::memory::AllocateOrThrow(24, 2);
  if (refpool::memory::GlobalAllocator::CurrentStats().bytes_in_use < 24) return false;
  refpool::memory::DeallocateOrLog(block);

  refpool::api::Status typo = refpool::memory::GlobalAllocator::ConfigureFromFile(typo_cfg);
  if (typo.code() != refpool::api::StatusCode::kInvalidArgument) return false;

  const bool has_mimalloc =
      refpool::memory::GlobalAllocator::IsBackendEnabled(refpool::memory::AllocBackend::kMimalloc);
  refpool::api::Status strict = refpool::memory::GlobalAllocator::ConfigureFromFile(bad_cfg);
  if (strict.ok() != has_mimalloc) return false;

  refpool::api::Status fallback = refpool::memory::GlobalAllocator::ConfigureFromFile(fallback_cfg);
  if (!fallback.ok()) return false;
  const refpool::memory::AllocBackend expected = has_mimalloc
                                                     ? refpool::memory::AllocBackend::kMimalloc
                                                     : refpool::memory::AllocBackend::kSystem;
  if (refpool::memory::GlobalAllocator::CurrentBackend() != expected) return false;
  if (std::string(refpool::memory::GlobalAllocator::CurrentBackendName()) !=
      refpool::memory::GlobalAllocator::BackendDisplayName(expected)) {
    return false;
  }

  // Back to the default for whatever runs next.
  if (!refpool::memory::GlobalAllocator::ConfigureFromFile(ok_cfg).ok()) return false;

  std::remove(ok_cfg.c_str());
  std::remove(bad_cfg.c_str());
  std::remove(fallback_cfg.c_str());
  std::remove(typo_cfg.c_str());
  return true;
}

bool TestPoolThroughEachBackend() {
  const refpool::memory::AllocBackend backends[] = {refpool::memory::AllocBackend::kSystem,
                                                    refpool::memory::AllocBackend::kTbbScalable,
                                                    refpool::memory::AllocBackend::kMimalloc};
  for (std::size_t i = 0; i < sizeof(backends) / sizeof(backends[0]); ++i) {
    if (!refpool::memory::GlobalAllocator::IsBackendEnabled(backends[i])) continue;
    refpool::memory::GlobalAllocatorOptions opts;
    opts.backend = backends[i];
    if (!refpool::memory::GlobalAllocator::Configure(opts).ok()) return false;
    {
      refpool::Pool<double> pool(8);
      pool.Fill();
      refpool::PoolRef<double> value = refpool::PoolRef<double>::New(pool, 2.5);
      if (*value != 2.5 || pool.Size() != 7) return false;
      if (refpool::memory::GlobalAllocator::CurrentStats().bytes_in_use == 0) return false;
    }
    if (refpool::memory::GlobalAllocator::CurrentStats().bytes_in_use != 0) return false;
  }
  refpool::memory::GlobalAllocatorOptions reset;
  return refpool::memory::GlobalAllocator::Configure(reset).ok();
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"api_version", TestApiVersion},
      {"factory_lifecycle", TestFactoryLifecycle},
      {"allocator_basic", TestAllocatorBasic},
      {"error_catalog", TestErrorCatalog},
      {"json_codec", TestJsonCodec},
      {"global_allocator_config", TestGlobalAllocatorConfig},
      {"pool_through_each_backend", TestPoolThroughEachBackend},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
