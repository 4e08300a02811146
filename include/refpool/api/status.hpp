#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "refpool/api/export.hpp"

namespace refpool {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kNotFound,
  kWouldBlock,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kLog = 0x10,
  kMemory = 0x30,
  kJson = 0x60,
  kPool = 0x70,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
REFPOOL_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                        std::uint32_t detail_id = 0);
REFPOOL_API const char* ErrorModuleName(ErrorModule module);
REFPOOL_API const char* StatusCodeName(StatusCode status_code);
REFPOOL_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
REFPOOL_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class REFPOOL_API Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  // detail_id 0 means the generic entry of the module.
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code), message_(std::move(message)), hex_code_(MakeErrorCode(module, code, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module) {
    return Status(code, std::move(message), module);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // "<code name> <hex code>: <message>", for log lines.
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

// Value or error. T must be default constructible; value() is meaningful only
// when ok().
template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : value_(value) {}
  Result(T&& value) : value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace refpool
