#include "refpool/pool/pool_options.hpp"

#include <cstdint>

namespace refpool {
namespace pool {

namespace {

api::Status InvalidCapacity(const std::string& message) {
  return api::Status(api::StatusCode::kInvalidArgument, message, api::ErrorModule::kPool, 0x0001);
}

api::Status InvalidConfig(const std::string& message) {
  return api::Status(api::StatusCode::kInvalidArgument, message, api::ErrorModule::kPool, 0x0002);
}

}  // namespace

api::Result<PoolOptions> ParsePoolOptions(const json::Json& root) {
  if (!root.is_object()) {
    return api::Result<PoolOptions>(InvalidConfig("root JSON must be object"));
  }

  const json::Json* section = &root;
  if (root.contains("pool")) {
    section = &root["pool"];
    if (!section->is_object()) {
      return api::Result<PoolOptions>(InvalidConfig("pool must be JSON object"));
    }
  }

  PoolOptions options;
  if (section->contains("capacity")) {
    const json::Json& capacity = (*section)["capacity"];
    if (capacity.is_number_integer() && !capacity.is_number_unsigned()) {
      return api::Result<PoolOptions>(InvalidCapacity("pool.capacity must not be negative"));
    }
    if (!capacity.is_number_unsigned()) {
      return api::Result<PoolOptions>(InvalidConfig("pool.capacity must be an integer"));
    }
    const std::uint64_t value = capacity.get<std::uint64_t>();
    if (value > kMaxConfiguredCapacity) {
      return api::Result<PoolOptions>(InvalidCapacity("pool.capacity is too large"));
    }
    options.capacity = static_cast<std::size_t>(value);
  }

  if (section->contains("prefill")) {
    if (!(*section)["prefill"].is_boolean()) {
      return api::Result<PoolOptions>(InvalidConfig("pool.prefill must be boolean"));
    }
    options.prefill = (*section)["prefill"].get<bool>();
  }

  return api::Result<PoolOptions>(options);
}

api::Result<PoolOptions> LoadPoolOptions(const std::string& path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(path);
  if (!loaded.ok()) {
    return api::Result<PoolOptions>(loaded.status());
  }
  return ParsePoolOptions(loaded.value());
}

json::Json PoolOptionsToJson(const PoolOptions& options) {
  json::Json out;
  out["pool"]["capacity"] = options.capacity;
  out["pool"]["prefill"] = options.prefill;
  return out;
}

}  // namespace pool
}  // namespace refpool
