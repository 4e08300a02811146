#pragma once

#include <cstddef>
#include <string>

#include "refpool/api/export.hpp"
#include "refpool/api/status.hpp"
#include "refpool/json/i_json.hpp"
#include "refpool/pool/pool.hpp"

namespace refpool {
namespace pool {

// Upper bound accepted from config files. The sync backend reserves one cell
// per unit of capacity up front.
static const std::size_t kMaxConfiguredCapacity = std::size_t(1) << 24;

struct PoolOptions {
  std::size_t capacity = 0;
  bool prefill = false;  // Fill() right after construction
};

// Reads options from the "pool" object of a JSON document, or from the root
// object when there is no "pool" key:
// {
//   "pool": {
//     "capacity": 1024,
//     "prefill": true
//   }
// }
// Missing keys keep their defaults. Out of range capacities give
// POOL_INVALID_CAPACITY, other malformed values POOL_CONFIG_INVALID.
REFPOOL_API api::Result<PoolOptions> ParsePoolOptions(const json::Json& root);

// Same, from a file. A missing file gives kNotFound.
REFPOOL_API api::Result<PoolOptions> LoadPoolOptions(const std::string& path);

REFPOOL_API json::Json PoolOptionsToJson(const PoolOptions& options);

template <typename A, typename S = sync::PoolUnsync>
Pool<A, S> MakePool(const PoolOptions& options) {
  Pool<A, S> pool(options.capacity);
  if (options.prefill) pool.Fill();
  return pool;
}

}  // namespace pool
}  // namespace refpool
