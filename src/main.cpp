#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "config.hpp"
#include "diagnostics.hpp"
#include "http/curl_http_client.hpp"
#include "local_fs/local_fs.hpp"
#include "session/session.hpp"
#include "transfer/transfer_executor.hpp"
#include "transport/line_stdio.hpp"

namespace {

constexpr const char *kVersion = "0.1.0";

void print_usage(std::ostream &out) {
  out << "Usage: relay-adapter [--config <path/to/config.yaml>] "
         "[--verbose | --quiet] [--version] [--help]\n"
         "\n"
         "Custom transfer adapter: reads line-delimited JSON requests on stdin,\n"
         "relays downloads/uploads to the given HTTP URLs and writes responses\n"
         "to stdout. Diagnostics go to stderr.\n";
}

} // namespace

int main(int argc, char **argv) {
  // Diagnostics start on defaults; the configured level applies once loaded
  relay_adapter::Diagnostics diag(std::cerr);

  // Parse command-line arguments
  std::optional<std::string> config_path;
  std::optional<relay_adapter::LogLevel> level_override;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--verbose") {
      level_override = relay_adapter::LogLevel::Debug;
    } else if (arg == "--quiet") {
      level_override = relay_adapter::LogLevel::Error;
    } else if (arg == "--version") {
      std::cout << "relay-adapter " << kVersion << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      diag.error("FATAL: unknown argument '" + arg + "'");
      print_usage(std::cerr);
      return 1;
    }
  }

  // Load configuration
  relay_adapter::AdapterConfig config;
  if (config_path) {
    try {
      diag.info("loading configuration from: " + *config_path);
      config = relay_adapter::load_config(*config_path);
    } catch (const std::exception &e) {
      diag.error("FATAL: Failed to load configuration: " + std::string(e.what()));
      return 1;
    }
  }
  const relay_adapter::LogLevel level =
      level_override ? *level_override : config.log_level;
  diag.set_level(level);

  // Responses go to a pipe the controller may close at any time
  std::string pipe_err;
  if (!transport::ignore_broken_pipe(pipe_err)) {
    diag.error("FATAL: " + pipe_err);
    return 1;
  }

  http::CurlGlobal curl_global;
  if (!curl_global.ok()) {
    diag.error("FATAL: curl_global_init failed");
    return 1;
  }

  http::CurlHttpClient client(config.http);
  local_fs::PosixFileSystem fs;
  transfer::TransferExecutor executor(client, fs, config.transfer, diag);

  diag.info(std::string("starting ") + kVersion +
            " (transport=stdio+json-lines, " + http::CurlHttpClient::version() +
            ", log level=" + relay_adapter::log_level_name(level) + ")");

  session::Session session(std::cin, std::cout, diag, executor);
  return session.run();
}
