#pragma once

#include <ostream>
#include <string>

namespace relay_adapter {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse log level from string
// Throws std::runtime_error if level is invalid
LogLevel parse_log_level(const std::string &level_str);

const char *log_level_name(LogLevel level);

// Diagnostic channel: prefixed lines on the error stream. Never part of the
// protocol; the controller may show or drop it.
class Diagnostics {
public:
  explicit Diagnostics(std::ostream &err, LogLevel min_level = LogLevel::Info,
                       std::string prefix = "relay-adapter");

  void set_level(LogLevel level) { min_level_ = level; }
  LogLevel level() const { return min_level_; }

  void log(LogLevel level, const std::string &msg);

  void debug(const std::string &msg) { log(LogLevel::Debug, msg); }
  void info(const std::string &msg) { log(LogLevel::Info, msg); }
  void warn(const std::string &msg) { log(LogLevel::Warn, "WARNING: " + msg); }
  void error(const std::string &msg) { log(LogLevel::Error, "ERROR: " + msg); }

private:
  std::ostream &err_;
  LogLevel min_level_;
  std::string prefix_;
};

} // namespace relay_adapter
