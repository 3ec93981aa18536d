#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace wire {

// Remote endpoint for one transfer. Headers are applied verbatim.
struct Action {
  std::string href;
  std::map<std::string, std::string> header;
  std::string expires_at; // informational, never enforced
};

struct InitRequest {
  std::string operation; // "upload" or "download"
  bool concurrent = false;
  int32_t concurrent_transfers = 0;
};

struct DownloadRequest {
  std::string oid;
  int64_t size = 0; // hint only
  Action action;
};

struct UploadRequest {
  std::string oid;
  int64_t size = 0;
  std::string path; // local source file
  Action action;
};

struct TerminateRequest {};

using Request =
    std::variant<InitRequest, DownloadRequest, UploadRequest, TerminateRequest>;

// Human-readable command name ("init", "download", ...)
const char *command_name(const Request &req);

struct TransferError {
  int code = 0;
  std::string message;
};

struct InitResponse {
  std::optional<TransferError> error;
};

struct ProgressResponse {
  std::string oid;
  int64_t bytes_so_far = 0;
  int64_t bytes_since_last = 0;
};

// Terminal response: exactly one per download/upload request.
// path is set only for a successful download; error set => failure.
struct TransferResponse {
  std::string oid;
  std::string path;
  std::optional<TransferError> error;

  bool ok() const { return !error.has_value(); }
};

using Response = std::variant<InitResponse, ProgressResponse, TransferResponse>;

inline TransferResponse transfer_ok(const std::string &oid,
                                    const std::string &path = std::string()) {
  TransferResponse r;
  r.oid = oid;
  r.path = path;
  return r;
}

inline TransferResponse transfer_failed(const std::string &oid, int code,
                                        const std::string &message) {
  TransferResponse r;
  r.oid = oid;
  r.error = TransferError{code, message};
  return r;
}

} // namespace wire
