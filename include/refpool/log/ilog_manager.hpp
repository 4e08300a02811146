#pragma once

#include <cstdint>
#include <string>

#include "refpool/api/status.hpp"
#include "refpool/api/version.hpp"
#include "refpool/log/log_types.hpp"

namespace refpool {
namespace log {

class ILogManager {
 public:
  virtual ~ILogManager() {}

  // 返回实现名称，便于排查当前绑定的实现。
  virtual const char* Name() const = 0;

  // 返回实现遵循的 API 版本，用于运行期兼容性检查。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 初始化日志系统（glog）。
  // 参数：
  // - app_name: 应用名，常用 argv[0]。
  // - config_path: 配置文件路径，可为空（使用默认配置）。
  // 返回：kOk 表示可开始写日志；失败时 message 给出原因。
  virtual api::Status Init(const std::string& app_name, const std::string& config_path) = 0;

  // 运行期重载配置。失败不会破坏已生效配置。
  virtual api::Status Reload(const std::string& config_path) = 0;

  // 写一条日志。
  virtual api::Status Log(LogSeverity severity, const std::string& message) = 0;

  // 读取当前已生效的日志配置快照。
  virtual api::Result<LoggingOptions> CurrentOptions() const = 0;

  // 关闭日志系统。重复调用返回 kOk。
  virtual api::Status Shutdown() = 0;
};

}  // namespace log
}  // namespace refpool
