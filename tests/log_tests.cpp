#include "refpool/log/log_manager.hpp"
#include "refpool/refpool.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (left[left.size() - 1] == '/') return left + right;
  return left + "/" + right;
}

bool MakeDirs(const std::string& path) {
  const std::string cmd = "mkdir -p \"" + path + "\"";
  return std::system(cmd.c_str()) == 0;
}

void RemoveTree(const std::string& path) {
  const std::string cmd = "rm -rf \"" + path + "\"";
  if (std::system(cmd.c_str()) != 0) {
    std::cerr << "could not remove " << path << "\n";
  }
}

std::string UniqueTestDir(const std::string& name) {
  const char* tmp = std::getenv("TMPDIR");
  const std::string base = (tmp && *tmp) ? tmp : "/tmp";
  const long long now = std::chrono::steady_clock::now().time_since_epoch().count();
  return JoinPath(base, "refpool_log_" + name + "_" + std::to_string(now));
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path.c_str());
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

bool TestReloadBeforeInitFails() { return !refpool::log::LogManager::Reload("not_used.conf"); }

bool TestParseConfigKeys() {
  const std::string root = UniqueTestDir("parse");
  const std::string cfg = JoinPath(root, "logging.conf");
  if (!MakeDirs(root)) return false;

  const std::string text =
      "# pool diagnostics\n"
      "log_dir = /var/tmp/refpool\n"
      "minloglevel = warning\n"
      "stderrthreshold: error\n"
      "v = 2   # overflow frees\n"
      "simple_format = yes\n"
      "unknown_key = whatever\n";
  if (!WriteTextFile(cfg, text)) return false;

  bool ok = false;
  const refpool::log::LoggingOptions opts = refpool::log::LogManager::LoadFromFile(cfg, &ok);
  if (!ok || opts.log_dir != "/var/tmp/refpool" || opts.min_log_level != 1 ||
      opts.stderr_threshold != 2 || opts.verbosity != 2 || !opts.simple_format) {
    RemoveTree(root);
    return false;
  }

  const std::string more = "MinLogLevel = warn\n"
                           "logtostderr: on // trailing comment\n"
                           "log_prefix = off\n";
  const std::string bad_level = "minloglevel = 7\n";
  const std::string bad_bool = "simple_format = maybe\n";
  const std::string more_cfg = JoinPath(root, "more.conf");
  const std::string level_cfg = JoinPath(root, "bad_level.conf");
  const std::string bool_cfg = JoinPath(root, "bad_bool.conf");
  if (!WriteTextFile(more_cfg, more) || !WriteTextFile(level_cfg, bad_level) ||
      !WriteTextFile(bool_cfg, bad_bool)) {
    RemoveTree(root);
    return false;
  }

  bool more_ok = false;
  const refpool::log::LoggingOptions more_opts =
      refpool::log::LogManager::LoadFromFile(more_cfg, &more_ok);
  bool level_ok = true;
  bool bool_ok = true;
  refpool::log::LogManager::LoadFromFile(level_cfg, &level_ok);
  refpool::log::LogManager::LoadFromFile(bool_cfg, &bool_ok);
  RemoveTree(root);
  return more_ok && more_opts.min_log_level == 1 && more_opts.logtostderr &&
         !more_opts.log_prefix && !level_ok && !bool_ok;
}

bool TestSimpleSinkWritesPoolLines() {
  const std::string root = UniqueTestDir("simple_sink");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string cfg = JoinPath(root, "logging.conf");
  if (!MakeDirs(root)) return false;

  const std::string config = "log_dir = " + logs_dir + "\n" + "simple_format = true\n" +
                             "install_failure_signal_handler = false\n" + "v = 1\n";
  if (!WriteTextFile(cfg, config)) return false;

  if (!refpool::log::LogManager::Init("log_tests", cfg)) return false;
  const refpool::log::LoggingOptions opts = refpool::log::LogManager::CurrentOptions();
  if (!opts.simple_format || opts.verbosity != 1) return false;

  refpool::log::LogManager::Log(refpool::log::LogSeverity::kInfo, "hello-pool");
  {
    // Pool lifecycle is logged at VLOG(1).
    refpool::Pool<int> pool(8);
    pool.Fill();
  }
  refpool::log::LogManager::Log(refpool::log::LogSeverity::kError, "error-pool");
  refpool::log::LogManager::Shutdown();

  const std::string body = ReadTextFile(JoinPath(logs_dir, "app.log"));
  const bool ok = body.find("[I] hello-pool") != std::string::npos &&
                  body.find("[E] error-pool") != std::string::npos &&
                  body.find("capacity=8") != std::string::npos &&
                  body.find("filled with 8 slots") != std::string::npos;

  RemoveTree(root);
  return ok;
}

bool TestReloadInvalidConfigKeepsOptions() {
  const std::string root = UniqueTestDir("reload_invalid");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string good_cfg = JoinPath(root, "good.conf");
  const std::string bad_cfg = JoinPath(root, "bad.conf");
  if (!MakeDirs(root)) return false;

  const std::string good = "log_dir = " + logs_dir + "\n" + "simple_format = true\n" +
                           "v = 2\n" + "install_failure_signal_handler = false\n";
  const std::string bad = "v = not_a_number\n";
  if (!WriteTextFile(good_cfg, good) || !WriteTextFile(bad_cfg, bad)) return false;

  if (!refpool::log::LogManager::Init("log_tests", good_cfg)) return false;
  const refpool::log::LoggingOptions before = refpool::log::LogManager::CurrentOptions();
  const bool reload_ok = refpool::log::LogManager::Reload(bad_cfg);
  const refpool::log::LoggingOptions after = refpool::log::LogManager::CurrentOptions();
  refpool::log::LogManager::Shutdown();

  RemoveTree(root);
  if (reload_ok) return false;
  return before.verbosity == after.verbosity && before.simple_format == after.simple_format &&
         before.log_dir == after.log_dir;
}

bool TestAdapterStatusCodes() {
  refpool::log::ILogManager* manager = refpool_create_log_manager();
  if (manager == NULL) return false;
  bool ok = manager->Reload("").code() == refpool::api::StatusCode::kInvalidArgument &&
            manager->Reload("missing.conf").code() == refpool::api::StatusCode::kNotInitialized &&
            manager->Log(refpool::log::LogSeverity::kInfo, "x").code() ==
                refpool::api::StatusCode::kNotInitialized &&
            manager->Init("log_tests", "refpool_missing_logging.conf").code() ==
                refpool::api::StatusCode::kInvalidArgument &&
            manager->Shutdown().ok();
  refpool_destroy_log_manager(manager);
  return ok;
}

int main() {
  struct Case {
    const char* name;
    bool (*fn)();
  };
  const Case cases[] = {{"reload_before_init", TestReloadBeforeInitFails},
                        {"parse_config_keys", TestParseConfigKeys},
                        {"simple_sink_writes_pool_lines", TestSimpleSinkWritesPoolLines},
                        {"reload_invalid_keep_options", TestReloadInvalidConfigKeepsOptions},
                        {"adapter_status_codes", TestAdapterStatusCodes}};

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
    std::cout << "[RUN ] " << cases[i].name << std::endl;
    const bool ok = cases[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << cases[i].name << '\n';
    if (!ok) ++failed;
  }
  return failed == 0 ? 0 : 1;
}
