#pragma once

#include <string>

namespace refpool {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options parsed from a "key = value" config file and
// applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool simple_format = false;  // "<ts> [I] message" lines in <log_dir>/app.log
  bool install_failure_signal_handler = true;
  // glog's own per-severity files under log_dir. Off means stderr plus the
  // optional app.log sink only.
  bool glog_file_output = false;
  bool logtostderr = false;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;  // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;
  int verbosity = 0;      // VLOG level; pool lifecycle uses 1, overflow frees use 2
};

}  // namespace log
}  // namespace refpool
