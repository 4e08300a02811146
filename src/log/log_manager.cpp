#include "refpool/log/log_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <memory>
#include <mutex>
#include <sys/stat.h>
#include <sys/types.h>
#if defined(_WIN32)
#include <direct.h>
#endif

#include <glog/logging.h>

namespace refpool {
namespace log {
namespace {

struct ManagerState {
  std::mutex mu;
  LoggingOptions options;
  std::string app_name;  // InitGoogleLogging keeps this pointer
  std::string output_dir;
  std::unique_ptr<google::LogSink> sink;
  bool initialized = false;
  bool failure_handler_installed = false;
};

ManagerState& State() {
  static ManagerState* state = new ManagerState();
  return *state;
}

std::string ProgramName(const std::string& app_name) {
  std::string name = app_name;
  while (!name.empty() && (name[name.size() - 1] == '/' || name[name.size() - 1] == '\\')) {
    name.erase(name.size() - 1);
  }
  const std::size_t slash = name.find_last_of("/\\");
  if (slash != std::string::npos) name = name.substr(slash + 1);
  return name.empty() ? std::string("refpool") : name;
}

std::string FileIn(const std::string& dir, const char* file) {
  if (dir.empty()) return file;
  const char last = dir[dir.size() - 1];
  return (last == '/' || last == '\\') ? dir + file : dir + "/" + file;
}

bool IsDirectory(const std::string& path) {
  struct stat info;
  return stat(path.c_str(), &info) == 0 && (info.st_mode & S_IFDIR) != 0;
}

// mkdir -p
bool EnsureDirectory(const std::string& path) {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;
  const std::size_t slash = path.find_last_of("/\\");
  if (slash != std::string::npos && slash > 0 && !EnsureDirectory(path.substr(0, slash))) {
    return false;
  }
  errno = 0;
#if defined(_WIN32)
  const int rc = _mkdir(path.c_str());
#else
  const int rc = mkdir(path.c_str(), 0755);
#endif
  return rc == 0 || errno == EEXIST;
}

const char kBlank[] = " \t\r\n";

std::string Strip(const std::string& text) {
  const std::size_t first = text.find_first_not_of(kBlank);
  if (first == std::string::npos) return std::string();
  return text.substr(first, text.find_last_not_of(kBlank) - first + 1);
}

// Drops a trailing "# ..." or "// ..." comment.
std::string WithoutComment(const std::string& text) {
  const std::size_t hash = text.find('#');
  const std::size_t slashes = text.find("//");
  const std::size_t cut = std::min(hash, slashes);
  return cut == std::string::npos ? text : text.substr(0, cut);
}

std::string Lower(const std::string& text) {
  std::string out(text);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
  }
  return out;
}

bool ReadBool(const std::string& value, bool* out) {
  static const char* const kTrue[] = {"1", "true", "yes", "on"};
  static const char* const kFalse[] = {"0", "false", "no", "off"};
  const std::string v = Lower(value);
  for (std::size_t i = 0; i < 4; ++i) {
    if (v == kTrue[i]) {
      *out = true;
      return true;
    }
    if (v == kFalse[i]) {
      *out = false;
      return true;
    }
  }
  return false;
}

bool ReadInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  *out = static_cast<int>(parsed);
  return true;
}

// "info", "warning"/"warn", "error", "fatal" or 0..3.
bool ReadSeverity(const std::string& value, int* out) {
  static const char* const kNames[] = {"info", "warning", "error", "fatal"};
  const std::string v = Lower(value);
  for (int level = 0; level < 4; ++level) {
    if (v == kNames[level]) {
      *out = level;
      return true;
    }
  }
  if (v == "warn") {
    *out = google::GLOG_WARNING;
    return true;
  }
  int level = 0;
  if (!ReadInt(v, &level) || level < 0 || level > 3) return false;
  *out = level;
  return true;
}

typedef bool (*KeyHandler)(const std::string& value, LoggingOptions* options);

struct ConfigKey {
  const char* name;
  KeyHandler apply;
};

const ConfigKey kConfigKeys[] = {
    {"log_dir",
     [](const std::string& v, LoggingOptions* o) -> bool {
       o->log_dir = v;
       return true;
     }},
    {"simple_format",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->simple_format); }},
    {"install_failure_signal_handler",
     [](const std::string& v, LoggingOptions* o) {
       return ReadBool(v, &o->install_failure_signal_handler);
     }},
    {"glog_file_output",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->glog_file_output); }},
    {"logtostderr",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->logtostderr); }},
    {"alsologtostderr",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->alsologtostderr); }},
    {"colorlogtostderr",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->colorlogtostderr); }},
    {"log_prefix",
     [](const std::string& v, LoggingOptions* o) { return ReadBool(v, &o->log_prefix); }},
    {"minloglevel",
     [](const std::string& v, LoggingOptions* o) { return ReadSeverity(v, &o->min_log_level); }},
    {"stderrthreshold",
     [](const std::string& v, LoggingOptions* o) {
       return ReadSeverity(v, &o->stderr_threshold);
     }},
    {"v", [](const std::string& v, LoggingOptions* o) { return ReadInt(v, &o->verbosity); }},
    {"verbosity",
     [](const std::string& v, LoggingOptions* o) { return ReadInt(v, &o->verbosity); }},
};

// One "key = value" (or "key: value") line. Unknown keys and lines without a
// separator are skipped; false only for a known key with a bad value.
bool ApplyLine(const std::string& raw_line, LoggingOptions* options) {
  const std::string line = Strip(WithoutComment(raw_line));
  const std::size_t sep = line.find_first_of("=:");
  if (line.empty() || sep == std::string::npos) return true;

  const std::string key = Lower(Strip(line.substr(0, sep)));
  const std::string value = Strip(line.substr(sep + 1));
  for (std::size_t i = 0; i < sizeof(kConfigKeys) / sizeof(kConfigKeys[0]); ++i) {
    if (key == kConfigKeys[i].name) return kConfigKeys[i].apply(value, options);
  }
  return true;
}

std::string NowForLog() {
  const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local = std::tm();
#if defined(_WIN32)
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  char date[24];
  std::strftime(date, sizeof(date), "%Y%m%d %H:%M:%S", &local);
  const long long micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000LL;
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%06lld", date, micros);
  return out;
}

// app.log sink: "<timestamp> [<I|W|E|F>] <message>".
class AppLogSink : public google::LogSink {
 public:
  explicit AppLogSink(const std::string& path) : out_(path.c_str(), std::ios::app) {}

  bool ok() const { return out_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, std::size_t message_len) override {
    while (message_len > 0 &&
           (message[message_len - 1] == '\n' || message[message_len - 1] == '\r')) {
      --message_len;
    }
    const char level = google::GetLogSeverityName(severity)[0];

    std::lock_guard<std::mutex> lock(mu_);
    out_ << NowForLog() << " [" << level << "] ";
    out_.write(message, static_cast<std::streamsize>(message_len));
    out_ << '\n';
    out_.flush();
  }

 private:
  std::mutex mu_;
  std::ofstream out_;
};

void RemoveSinkLocked(ManagerState& state) {
  if (!state.sink) return;
  google::RemoveLogSink(state.sink.get());
  state.sink.reset();
}

}  // namespace

bool LogManager::Init(const std::string& app_name, const std::string& config_path) {
  ManagerState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return true;

  bool ok = true;
  const LoggingOptions options = LoadFromFile(config_path, &ok);
  if (!ok) return false;

  if (!google::IsGoogleLoggingInitialized()) {
    // Anything logged before the flags are applied goes to stderr.
    FLAGS_logtostderr = true;
    state.app_name = ProgramName(app_name);
    google::InitGoogleLogging(state.app_name.c_str());
  }

  if (!ApplyOptions(options)) {
    RemoveSinkLocked(state);
    state.output_dir.clear();
    google::ShutdownGoogleLogging();
    return false;
  }
  state.initialized = true;
  VLOG(1) << "logging ready, v=" << options.verbosity;
  return true;
}

bool LogManager::Reload(const std::string& config_path) {
  ManagerState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return false;

  bool ok = true;
  const LoggingOptions options = LoadFromFile(config_path, &ok);
  return ok && ApplyOptions(options);
}

LoggingOptions LogManager::CurrentOptions() {
  ManagerState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.options;
}

bool LogManager::IsInitialized() {
  ManagerState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.initialized;
}

void LogManager::Shutdown() {
  ManagerState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return;
  RemoveSinkLocked(state);
  google::ShutdownGoogleLogging();
  state.output_dir.clear();
  state.initialized = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::max(0, std::min(3, static_cast<int>(severity)));
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

// Called with State().mu held. Leaves the previous setup in place on failure.
bool LogManager::ApplyOptions(const LoggingOptions& options) {
  ManagerState& state = State();
  if (!options.log_dir.empty() && !EnsureDirectory(options.log_dir)) return false;

  std::unique_ptr<AppLogSink> sink;
  if (options.simple_format) {
    sink.reset(new AppLogSink(FileIn(options.log_dir.empty() ? "." : options.log_dir, "app.log")));
    if (!sink->ok()) return false;
  }

  state.output_dir = options.log_dir;
  const bool glog_files = options.glog_file_output && !state.output_dir.empty();
  FLAGS_log_dir = glog_files ? state.output_dir : std::string();
  // glog opens fallback files in /tmp unless it logs to stderr only.
  FLAGS_logtostderr = glog_files ? options.logtostderr : true;
  FLAGS_alsologtostderr = glog_files && options.alsologtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !state.failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state.failure_handler_installed = true;
  }

  RemoveSinkLocked(state);
  if (sink) {
    state.sink.reset(sink.release());
    google::AddLogSink(state.sink.get());
  }
  state.options = options;
  return true;
}

LoggingOptions LogManager::LoadFromFile(const std::string& path, bool* ok) {
  LoggingOptions options;
  bool success = true;
  if (!path.empty()) {
    std::ifstream input(path.c_str());
    success = input.is_open();
    std::string line;
    while (success && std::getline(input, line)) {
      if (!ApplyLine(line, &options)) success = false;
    }
  }
  if (ok) *ok = success;
  return options;
}

}  // namespace log
}  // namespace refpool
