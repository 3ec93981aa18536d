#pragma once

#include <cstdint>

#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../http/http_client.hpp"
#include "../local_fs/local_fs.hpp"
#include "../wire/messages.hpp"
#include "progress_sink.hpp"

namespace transfer {

// Terminal outcome of one transfer plus the byte count moved.
struct TransferResult {
  wire::TransferResponse response;
  int64_t bytes = 0;
};

// Runs one download or upload to completion. Holds no per-transfer state
// between calls: each call streams through `progress` zero or more times and
// returns exactly one terminal response, which the caller emits.
class TransferExecutor {
public:
  TransferExecutor(http::HttpClient &client, local_fs::FileSystem &fs,
                   relay_adapter::TransferConfig config,
                   relay_adapter::Diagnostics &diag);

  // GET action.href into a new temp file. On success the response carries
  // the temp file's absolute path and the file belongs to the caller; on any
  // failure the file has been removed.
  TransferResult download(const wire::DownloadRequest &req,
                          ProgressSink &progress);

  // PUT the contents of req.path to action.href.
  TransferResult upload(const wire::UploadRequest &req, ProgressSink &progress);

  // Removes a downloaded file whose completion never reached the controller.
  void discard(const wire::TransferResponse &response);

private:
  http::HttpClient &client_;
  local_fs::FileSystem &fs_;
  relay_adapter::TransferConfig config_;
  relay_adapter::Diagnostics &diag_;
};

} // namespace transfer
