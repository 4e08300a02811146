#include "log/log_manager_adapter.hpp"

#include "refpool/log/log_manager.hpp"

namespace refpool {
namespace log {
namespace {

api::Status LogError(api::StatusCode code, const char* message) {
  return api::Status::FromModule(code, message, api::ErrorModule::kLog);
}

class GlogManager : public ILogManager {
 public:
  const char* Name() const override { return "refpool.log.glog_adapter"; }
  std::uint32_t ApiVersion() const override { return api::kApiVersion; }
  void Release() override { delete this; }

  api::Status Init(const std::string& app_name, const std::string& config_path) override {
    if (app_name.empty()) {
      return LogError(api::StatusCode::kInvalidArgument, "app_name is empty");
    }
    // Parse first so a bad file is reported as such, not as a glog failure.
    bool parsed = true;
    LogManager::LoadFromFile(config_path, &parsed);
    if (!parsed) {
      return api::Status(api::StatusCode::kInvalidArgument,
                         "logging config is missing or has invalid values",
                         api::ErrorModule::kLog, 0x0001);
    }
    if (!LogManager::Init(app_name, config_path)) {
      return LogError(api::StatusCode::kInternalError, "LogManager::Init failed");
    }
    return api::Status::Ok();
  }

  api::Status Reload(const std::string& config_path) override {
    if (config_path.empty()) {
      return LogError(api::StatusCode::kInvalidArgument, "config_path is empty");
    }
    if (!LogManager::IsInitialized()) {
      return LogError(api::StatusCode::kNotInitialized, "logging is not initialized");
    }
    return LogManager::Reload(config_path)
               ? api::Status::Ok()
               : LogError(api::StatusCode::kInternalError, "LogManager::Reload failed");
  }

  api::Status Log(LogSeverity severity, const std::string& message) override {
    if (!LogManager::IsInitialized()) {
      return LogError(api::StatusCode::kNotInitialized, "logging is not initialized");
    }
    LogManager::Log(severity, message);
    return api::Status::Ok();
  }

  api::Result<LoggingOptions> CurrentOptions() const override {
    return api::Result<LoggingOptions>(LogManager::CurrentOptions());
  }

  api::Status Shutdown() override {
    LogManager::Shutdown();
    return api::Status::Ok();
  }
};

}  // namespace

ILogManager* NewLogManagerAdapter() { return new GlogManager(); }

}  // namespace log
}  // namespace refpool
