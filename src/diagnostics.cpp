#include "diagnostics.hpp"

#include <stdexcept>
#include <utility>

namespace relay_adapter {

LogLevel parse_log_level(const std::string &level_str) {
  if (level_str == "debug") {
    return LogLevel::Debug;
  } else if (level_str == "info") {
    return LogLevel::Info;
  } else if (level_str == "warn") {
    return LogLevel::Warn;
  } else if (level_str == "error") {
    return LogLevel::Error;
  } else {
    throw std::runtime_error("Invalid logging.level: '" + level_str +
                             "'. Valid values: debug, info, warn, error");
  }
}

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "unknown";
}

Diagnostics::Diagnostics(std::ostream &err, LogLevel min_level,
                         std::string prefix)
    : err_(err), min_level_(min_level), prefix_(std::move(prefix)) {}

void Diagnostics::log(LogLevel level, const std::string &msg) {
  if (level < min_level_) {
    return;
  }
  err_ << prefix_ << ": " << msg << "\n" << std::flush;
}

} // namespace relay_adapter
