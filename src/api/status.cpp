#include "refpool/api/status.hpp"

#include <cstdio>

namespace refpool {
namespace api {

namespace {

std::uint32_t Pack(ErrorModule module, StatusCode status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) | (detail & 0x000FFFFFu);
}

struct ModuleName {
  ErrorModule module;
  const char* name;
};

const ModuleName kModuleNames[] = {
    {ErrorModule::kCore, "core"},
    {ErrorModule::kLog, "log"},
    {ErrorModule::kMemory, "memory"},
    {ErrorModule::kJson, "json"},
    {ErrorModule::kPool, "pool"},
};

// Indexed by StatusCode.
const char* const kStatusNames[] = {
    "kOk", "kInvalidArgument", "kNotInitialized", "kNotFound", "kWouldBlock",
    "kIoError", "kInternalError", "kUnsupported",
};

// Generic entries carry detail id 0; module entries keep their own ids.
const ErrorCatalogEntry kErrorCatalog[] = {
    {Pack(ErrorModule::kCore, StatusCode::kOk, 0), "CORE_OK", "Operation succeeded"},
    {Pack(ErrorModule::kCore, StatusCode::kInvalidArgument, 0), "CORE_INVALID_ARGUMENT",
     "Invalid argument"},
    {Pack(ErrorModule::kCore, StatusCode::kNotInitialized, 0), "CORE_NOT_INITIALIZED",
     "Object not initialized"},
    {Pack(ErrorModule::kCore, StatusCode::kNotFound, 0), "CORE_NOT_FOUND",
     "Resource not found"},
    {Pack(ErrorModule::kCore, StatusCode::kWouldBlock, 0), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {Pack(ErrorModule::kCore, StatusCode::kIoError, 0), "CORE_IO_ERROR", "I/O error"},
    {Pack(ErrorModule::kCore, StatusCode::kInternalError, 0), "CORE_INTERNAL_ERROR",
     "Internal error"},
    {Pack(ErrorModule::kCore, StatusCode::kUnsupported, 0), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    {Pack(ErrorModule::kMemory, StatusCode::kInvalidArgument, 0x0001), "MEM_INVALID_ALIGNMENT",
     "Invalid memory alignment"},
    {Pack(ErrorModule::kMemory, StatusCode::kWouldBlock, 0x0001), "MEM_BACKEND_IN_USE",
     "Allocator backend still has live allocations"},
    {Pack(ErrorModule::kJson, StatusCode::kInvalidArgument, 0x0001), "JSON_PARSE_FAILED",
     "JSON parse failed"},
    {Pack(ErrorModule::kLog, StatusCode::kInvalidArgument, 0x0001), "LOG_CONFIG_INVALID",
     "Logging config has invalid values"},
    {Pack(ErrorModule::kPool, StatusCode::kInvalidArgument, 0x0001), "POOL_INVALID_CAPACITY",
     "Pool capacity is out of range"},
    {Pack(ErrorModule::kPool, StatusCode::kInvalidArgument, 0x0002), "POOL_CONFIG_INVALID",
     "Pool config has invalid values"},
};

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return Pack(module, status_code, detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  for (std::size_t i = 0; i < sizeof(kModuleNames) / sizeof(kModuleNames[0]); ++i) {
    if (kModuleNames[i].module == module) return kModuleNames[i].name;
  }
  return "unknown";
}

const char* StatusCodeName(StatusCode status_code) {
  const std::size_t index = static_cast<std::size_t>(status_code);
  if (index >= sizeof(kStatusNames) / sizeof(kStatusNames[0])) return "kUnknown";
  return kStatusNames[index];
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  std::string out(StatusCodeName(code_));
  out += " ";
  out += hex_code_string();
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace refpool
