#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <set>
#include <stdexcept>

namespace relay_adapter {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMinChunkSize = 1024;
constexpr std::size_t kMaxChunkSize = 16u * 1024u * 1024u;

void reject_unknown_keys(const YAML::Node &node, const std::string &section,
                         const std::set<std::string> &allowed) {
  for (const auto &kv : node) {
    const std::string key = kv.first.as<std::string>();
    if (allowed.find(key) == allowed.end()) {
      throw std::runtime_error("[CONFIG] Unknown key '" +
                               (section.empty() ? key : section + "." + key) +
                               "'");
    }
  }
}

void require_map(const YAML::Node &node, const std::string &section) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] '" + section +
                             "' section must be a map");
  }
}

template <typename T>
T read_scalar(const YAML::Node &node, const std::string &key) {
  try {
    return node.as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid " + key + ": " + e.what());
  }
}

void parse_logging(const YAML::Node &node, AdapterConfig &config) {
  require_map(node, "logging");
  reject_unknown_keys(node, "logging", {"level"});

  if (node["level"]) {
    const auto level_str =
        read_scalar<std::string>(node["level"], "logging.level");
    try {
      config.log_level = parse_log_level(level_str);
    } catch (const std::exception &e) {
      throw std::runtime_error("[CONFIG] " + std::string(e.what()));
    }
  }
}

void parse_transfer(const YAML::Node &node, TransferConfig &transfer) {
  require_map(node, "transfer");
  reject_unknown_keys(node, "transfer",
                      {"temp_dir", "temp_prefix", "chunk_size"});

  if (node["temp_dir"]) {
    transfer.temp_dir =
        read_scalar<std::string>(node["temp_dir"], "transfer.temp_dir");
    if (!transfer.temp_dir.empty() && !fs::is_directory(transfer.temp_dir)) {
      throw std::runtime_error("[CONFIG] transfer.temp_dir '" +
                               transfer.temp_dir + "' is not a directory");
    }
  }

  if (node["temp_prefix"]) {
    transfer.temp_prefix =
        read_scalar<std::string>(node["temp_prefix"], "transfer.temp_prefix");
    if (transfer.temp_prefix.empty() ||
        transfer.temp_prefix.find('/') != std::string::npos) {
      throw std::runtime_error(
          "[CONFIG] transfer.temp_prefix must be a non-empty file name prefix");
    }
  }

  if (node["chunk_size"]) {
    const auto chunk =
        read_scalar<int64_t>(node["chunk_size"], "transfer.chunk_size");
    if (chunk < static_cast<int64_t>(kMinChunkSize) ||
        chunk > static_cast<int64_t>(kMaxChunkSize)) {
      throw std::runtime_error(
          "[CONFIG] transfer.chunk_size must be in range [1024, 16777216]");
    }
    transfer.chunk_size = static_cast<std::size_t>(chunk);
  }
}

void parse_http(const YAML::Node &node, HttpConfig &http) {
  require_map(node, "http");
  reject_unknown_keys(node, "http",
                      {"user_agent", "connect_timeout_ms",
                       "low_speed_limit_bytes", "low_speed_time_s",
                       "follow_redirects", "max_redirects", "ca_bundle",
                       "verify_tls"});

  if (node["user_agent"]) {
    http.user_agent =
        read_scalar<std::string>(node["user_agent"], "http.user_agent");
  }
  if (node["connect_timeout_ms"]) {
    http.connect_timeout_ms =
        read_scalar<int64_t>(node["connect_timeout_ms"], "http.connect_timeout_ms");
    if (http.connect_timeout_ms <= 0) {
      throw std::runtime_error("[CONFIG] http.connect_timeout_ms must be > 0");
    }
  }
  if (node["low_speed_limit_bytes"]) {
    http.low_speed_limit_bytes = read_scalar<int64_t>(
        node["low_speed_limit_bytes"], "http.low_speed_limit_bytes");
    if (http.low_speed_limit_bytes < 0) {
      throw std::runtime_error("[CONFIG] http.low_speed_limit_bytes must be >= 0");
    }
  }
  if (node["low_speed_time_s"]) {
    http.low_speed_time_s =
        read_scalar<int64_t>(node["low_speed_time_s"], "http.low_speed_time_s");
    if (http.low_speed_time_s < 0) {
      throw std::runtime_error("[CONFIG] http.low_speed_time_s must be >= 0");
    }
  }
  if (node["follow_redirects"]) {
    http.follow_redirects =
        read_scalar<bool>(node["follow_redirects"], "http.follow_redirects");
  }
  if (node["max_redirects"]) {
    http.max_redirects =
        read_scalar<int64_t>(node["max_redirects"], "http.max_redirects");
    if (http.max_redirects < 0 || http.max_redirects > 50) {
      throw std::runtime_error("[CONFIG] http.max_redirects must be in range [0, 50]");
    }
  }
  if (node["ca_bundle"]) {
    http.ca_bundle = read_scalar<std::string>(node["ca_bundle"], "http.ca_bundle");
    if (!http.ca_bundle.empty() && !fs::exists(http.ca_bundle)) {
      throw std::runtime_error("[CONFIG] http.ca_bundle '" + http.ca_bundle +
                               "' does not exist");
    }
  }
  if (node["verify_tls"]) {
    http.verify_tls = read_scalar<bool>(node["verify_tls"], "http.verify_tls");
  }
}

AdapterConfig parse_root(const YAML::Node &yaml) {
  AdapterConfig config;

  // An empty document means "all defaults"
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] top level must be a map");
  }

  reject_unknown_keys(yaml, "", {"logging", "transfer", "http"});

  if (yaml["logging"]) {
    parse_logging(yaml["logging"], config);
  }
  if (yaml["transfer"]) {
    parse_transfer(yaml["transfer"], config.transfer);
  }
  if (yaml["http"]) {
    parse_http(yaml["http"], config.http);
  }

  return config;
}

} // namespace

AdapterConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  AdapterConfig config = parse_root(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

AdapterConfig parse_config(const std::string &yaml_text) {
  YAML::Node yaml;

  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to parse config: " + std::string(e.what()));
  }

  return parse_root(yaml);
}

} // namespace relay_adapter
