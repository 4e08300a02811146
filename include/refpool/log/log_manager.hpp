#pragma once

#include <string>

#include "refpool/api/export.hpp"
#include "refpool/log/log_types.hpp"

namespace refpool {
namespace log {

// Process-wide glog setup. Pool internals log through glog directly; this
// class only owns initialisation, flags and the optional file sink.
class REFPOOL_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // Returns true when already initialized.
  static bool Init(const std::string& app_name, const std::string& config_path = std::string());

  // Reload configuration at runtime. Returns false on load/apply failures and
  // keeps the previously applied options.
  static bool Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();
  static bool IsInitialized();

  static void Shutdown();

  // Logging entry point that keeps glog headers away from callers.
  static void Log(LogSeverity severity, const std::string& message);

  // Parse a config file without applying it.
  static LoggingOptions LoadFromFile(const std::string& path, bool* ok);

 private:
  static bool ApplyOptions(const LoggingOptions& options);
};

}  // namespace log
}  // namespace refpool
