#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "../diagnostics.hpp"
#include "../transfer/transfer_executor.hpp"
#include "../wire/messages.hpp"
#include "../wire/response_writer.hpp"

namespace session {

enum class State { Uninitialized, Ready, Terminated };

const char *state_name(State state);

struct SessionStats {
  uint64_t requests = 0;  // decoded requests of any kind
  uint64_t malformed = 0; // lines skipped as undecodable
  uint64_t downloads_ok = 0;
  uint64_t downloads_failed = 0;
  uint64_t uploads_ok = 0;
  uint64_t uploads_failed = 0;
  int64_t bytes_downloaded = 0;
  int64_t bytes_uploaded = 0;
};

// Read loop for one controller connection: one request line at a time,
// each fully handled (and answered) before the next line is read.
class Session {
public:
  Session(std::istream &in, std::ostream &out, relay_adapter::Diagnostics &diag,
          transfer::TransferExecutor &executor);

  // Runs until terminate or end of input.
  // Returns the process exit status: 0 on a clean end, 2 if the input
  // stream failed.
  int run();

  State state() const { return state_; }
  const std::string &operation() const { return operation_; }
  const SessionStats &stats() const { return stats_; }

private:
  void dispatch_line(const std::string &line);

  void handle_init(const wire::InitRequest &req);
  void handle_download(const wire::DownloadRequest &req);
  void handle_upload(const wire::UploadRequest &req);
  void handle_terminate();

  void warn_if_uninitialized(const char *command);
  void log_outcome(const char *command, const transfer::TransferResult &result);
  void log_stats();

  std::istream &in_;
  relay_adapter::Diagnostics &diag_;
  transfer::TransferExecutor &executor_;
  wire::ResponseWriter writer_;

  State state_ = State::Uninitialized;
  std::string operation_;
  SessionStats stats_;
};

} // namespace session
