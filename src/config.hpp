#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "diagnostics.hpp"

namespace relay_adapter {

// Transfer executor settings
struct TransferConfig {
  std::string temp_dir;                 // Empty: system temp directory
  std::string temp_prefix = "lfscustomdl";
  std::size_t chunk_size = 64 * 1024;  // Read/write granularity (bytes)
};

// libcurl settings
struct HttpConfig {
  std::string user_agent = "relay-adapter/0.1.0";
  int64_t connect_timeout_ms = 30000;
  int64_t low_speed_limit_bytes = 1; // Abort below this rate...
  int64_t low_speed_time_s = 60;     // ...for this long (0 disables)
  bool follow_redirects = true;
  int64_t max_redirects = 10;
  std::string ca_bundle; // Empty: libcurl default
  bool verify_tls = true;
};

// Complete adapter configuration
struct AdapterConfig {
  std::string config_file_path; // Empty when running on defaults
  LogLevel log_level = LogLevel::Info;
  TransferConfig transfer;
  HttpConfig http;
};

// Load adapter configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
AdapterConfig load_config(const std::string &path);

// Parse adapter configuration from YAML text (same rules as load_config)
AdapterConfig parse_config(const std::string &yaml_text);

} // namespace relay_adapter
