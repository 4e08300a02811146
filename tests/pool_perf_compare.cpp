#include "refpool/refpool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

namespace {

struct BenchObj {
  std::uint64_t a;
  std::uint64_t b;
  std::uint64_t c;
  std::uint64_t d;
  BenchObj() : a(0), b(0), c(0), d(0) {}
};

}  // namespace

REFPOOL_POOL_DEFAULT_IMPL(BenchObj)

namespace {

typedef std::chrono::high_resolution_clock Clock;

// Live handles per round; matches the pool capacity so steady state never overflows.
const std::size_t kBatch = 1024;

double SecondsSince(const Clock::time_point& start, const Clock::time_point& end) {
  return std::chrono::duration_cast<std::chrono::duration<double> >(end - start).count();
}

void PrintRow(const char* name, std::size_t iterations, double seconds) {
  const double ops_per_sec = seconds > 0.0 ? (static_cast<double>(iterations) / seconds) : 0.0;
  std::printf("%-30s iter=%zu sec=%.6f ops/s=%.2f\n", name, iterations, seconds, ops_per_sec);
}

double BenchNewDelete(std::size_t iterations) {
  std::vector<BenchObj*> live;
  live.reserve(kBatch);
  const Clock::time_point begin = Clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    BenchObj* obj = new BenchObj();
    obj->a = i;
    live.push_back(obj);
    if (live.size() == kBatch) {
      for (std::size_t j = 0; j < live.size(); ++j) delete live[j];
      live.clear();
    }
  }
  for (std::size_t j = 0; j < live.size(); ++j) delete live[j];
  return SecondsSince(begin, Clock::now());
}

double BenchSharedPtr(std::size_t iterations) {
  std::vector<std::shared_ptr<BenchObj> > live;
  live.reserve(kBatch);
  const Clock::time_point begin = Clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    std::shared_ptr<BenchObj> obj = std::make_shared<BenchObj>();
    obj->a = i;
    live.push_back(obj);
    if (live.size() == kBatch) live.clear();
  }
  live.clear();
  return SecondsSince(begin, Clock::now());
}

template <typename Ref, typename PoolT>
double BenchPoolRef(PoolT& pool, std::size_t iterations) {
  std::vector<Ref> live;
  live.reserve(kBatch);
  const Clock::time_point begin = Clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    Ref obj = Ref::Default(pool);
    live.push_back(obj);
    if (live.size() == kBatch) live.clear();
  }
  live.clear();
  return SecondsSince(begin, Clock::now());
}

double BenchPoolBox(std::size_t iterations) {
  refpool::Pool<BenchObj> pool(kBatch);
  pool.Fill();
  std::vector<refpool::PoolBox<BenchObj> > live;
  live.reserve(kBatch);
  const Clock::time_point begin = Clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    refpool::PoolBox<BenchObj> obj = refpool::PoolBox<BenchObj>::Default(pool);
    obj->a = i;
    live.push_back(std::move(obj));
    if (live.size() == kBatch) live.clear();
  }
  live.clear();
  return SecondsSince(begin, Clock::now());
}

bool TryBenchBackend(refpool::memory::AllocBackend backend, std::size_t iterations, bool* ran,
                     double* seconds_out) {
  if (ran == NULL || seconds_out == NULL) return false;
  *ran = false;
  *seconds_out = 0.0;

  refpool::memory::GlobalAllocatorOptions opt;
  opt.backend = backend;
  opt.strict_backend = true;
  refpool::api::Status st = refpool::memory::GlobalAllocator::Configure(opt);
  if (!st.ok()) {
    if (st.code() == refpool::api::StatusCode::kUnsupported) {
      return true;  // backend not compiled in
    }
    return false;
  }

  {
    // Empty pool: every Default goes to the allocator until slots come back.
    refpool::Pool<BenchObj> pool(kBatch);
    *seconds_out = BenchPoolRef<refpool::PoolRef<BenchObj> >(pool, iterations);
  }
  *ran = true;

  refpool::memory::GlobalAllocatorOptions reset;
  reset.backend = refpool::memory::AllocBackend::kSystem;
  reset.strict_backend = true;
  return refpool::memory::GlobalAllocator::Configure(reset).ok();
}

}  // namespace

int main(int argc, char** argv) {
  std::size_t iterations = 300000;
  if (argc > 1) {
    const long long n = std::atoll(argv[1]);
    if (n > 0) iterations = static_cast<std::size_t>(n);
  }

  std::printf("[pool-perf] iterations=%zu batch=%zu\n", iterations, kBatch);

  PrintRow("new_delete", iterations, BenchNewDelete(iterations));
  PrintRow("shared_ptr", iterations, BenchSharedPtr(iterations));
  {
    refpool::Pool<BenchObj> pool(kBatch);
    pool.Fill();
    PrintRow("pool_ref", iterations, BenchPoolRef<refpool::PoolRef<BenchObj> >(pool, iterations));
  }
  {
    refpool::SyncPool<BenchObj> pool(kBatch);
    pool.Fill();
    PrintRow("sync_pool_ref", iterations,
             BenchPoolRef<refpool::SyncPoolRef<BenchObj> >(pool, iterations));
  }
  {
    refpool::fake::Pool<BenchObj> pool(kBatch);
    PrintRow("fake_pool_ref", iterations,
             BenchPoolRef<refpool::fake::PoolRef<BenchObj> >(pool, iterations));
  }
  PrintRow("pool_box", iterations, BenchPoolBox(iterations));

  const refpool::memory::AllocBackend backends[] = {
      refpool::memory::AllocBackend::kSystem,
      refpool::memory::AllocBackend::kMimalloc,
      refpool::memory::AllocBackend::kTbbScalable,
  };

  for (std::size_t i = 0; i < sizeof(backends) / sizeof(backends[0]); ++i) {
    const char* name = refpool::memory::GlobalAllocator::BackendDisplayName(backends[i]);
    bool ran = false;
    double sec = 0.0;
    if (!TryBenchBackend(backends[i], iterations, &ran, &sec)) {
      std::printf("backend bench failed: %s\n", name);
      return 1;
    }
    char label[64] = {0};
    std::snprintf(label, sizeof(label), "pool_ref_cold[%s]", name);
    if (ran) {
      PrintRow(label, iterations, sec);
    } else {
      std::printf("%-30s SKIP (backend unavailable)\n", label);
    }
  }

  return 0;
}
