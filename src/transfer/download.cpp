#include "transfer_executor.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "error_codes.hpp"

namespace transfer {

namespace {

enum class DownloadFailure { None, Status, TempCreate, Write };

// Streams the response body into a temp file created on the response head.
class DownloadHandler : public http::ResponseHandler {
public:
  DownloadHandler(const std::string &oid, local_fs::FileSystem &fs,
                  const relay_adapter::TransferConfig &config,
                  ProgressSink &progress)
      : oid_(oid), fs_(fs), config_(config), progress_(progress) {}

  bool on_response(const http::HttpResponseHead &head) override {
    started_ = true;
    head_ = head;

    if (is_failure_status(head.status)) {
      failure_ = DownloadFailure::Status;
      return false;
    }

    file_ = fs_.create_temp_file(config_.temp_dir, config_.temp_prefix,
                                 failure_message_);
    if (!file_) {
      failure_ = DownloadFailure::TempCreate;
      return false;
    }
    guard_ = std::make_unique<local_fs::TempFileGuard>(fs_, file_->path());
    return true;
  }

  bool on_body(const char *data, std::size_t len) override {
    if (!file_) {
      return false;
    }

    const std::size_t chunk = std::max<std::size_t>(config_.chunk_size, 1);
    std::size_t offset = 0;
    while (offset < len) {
      const std::size_t n = std::min(chunk, len - offset);
      if (!file_->write(data + offset, n, failure_message_)) {
        failure_ = DownloadFailure::Write;
        return false;
      }
      offset += n;
      written_ += static_cast<int64_t>(n);
      progress_.report(oid_, written_, static_cast<int64_t>(n));
    }
    return true;
  }

  bool started() const { return started_; }
  DownloadFailure failure() const { return failure_; }
  const std::string &failure_message() const { return failure_message_; }
  const http::HttpResponseHead &head() const { return head_; }
  int64_t written() const { return written_; }

  local_fs::WritableFile *file() { return file_.get(); }
  local_fs::TempFileGuard *guard() { return guard_.get(); }

private:
  const std::string &oid_;
  local_fs::FileSystem &fs_;
  const relay_adapter::TransferConfig &config_;
  ProgressSink &progress_;

  bool started_ = false;
  http::HttpResponseHead head_;
  DownloadFailure failure_ = DownloadFailure::None;
  std::string failure_message_;
  std::unique_ptr<local_fs::WritableFile> file_;
  std::unique_ptr<local_fs::TempFileGuard> guard_;
  int64_t written_ = 0;
};

} // namespace

TransferExecutor::TransferExecutor(http::HttpClient &client,
                                   local_fs::FileSystem &fs,
                                   relay_adapter::TransferConfig config,
                                   relay_adapter::Diagnostics &diag)
    : client_(client), fs_(fs), config_(std::move(config)), diag_(diag) {}

TransferResult TransferExecutor::download(const wire::DownloadRequest &req,
                                          ProgressSink &progress) {
  TransferResult result;

  http::HttpRequest request;
  request.method = "GET";
  request.url = req.action.href;
  request.headers = req.action.header;

  std::string err;
  auto call = client_.prepare(request, err);
  if (!call) {
    result.response =
        wire::transfer_failed(req.oid, to_wire(ErrorCode::RequestConstruction), err);
    return result;
  }

  DownloadHandler handler(req.oid, fs_, config_, progress);
  const http::HttpResult http_result = call->perform(nullptr, handler);
  result.bytes = handler.written();

  // Drops the temp file (if any) after a failure
  auto discard = [&](const std::string &why) {
    if (handler.file() != nullptr) {
      std::string close_err;
      if (!handler.file()->close(close_err)) {
        diag_.debug("close after " + why + " failed: " + close_err);
      }
    }
    if (handler.guard() != nullptr) {
      std::string rm_err;
      if (!handler.guard()->remove(rm_err)) {
        diag_.warn("cannot remove tempfile after " + why + ": " + rm_err);
      }
    }
  };

  switch (handler.failure()) {
  case DownloadFailure::Status:
    result.response = wire::transfer_failed(
        req.oid, remote_status_code(handler.head().status),
        "Invalid status for " + http::describe_request(request) + ": " +
            std::to_string(handler.head().status));
    return result;

  case DownloadFailure::TempCreate:
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::LocalRead),
        "cannot create tempfile: " + handler.failure_message());
    return result;

  case DownloadFailure::Write: {
    const std::string path = handler.file()->path();
    discard("write error");
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::LocalWrite),
        "cannot write data to tempfile \"" + path +
            "\": " + handler.failure_message());
    return result;
  }

  case DownloadFailure::None:
    break;
  }

  if (!http_result.ok()) {
    discard("transport error");
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::Transport),
        "Error downloading data for " + req.oid + ": " + http_result.message);
    return result;
  }

  if (!handler.started() || handler.file() == nullptr) {
    discard("missing response");
    result.response =
        wire::transfer_failed(req.oid, to_wire(ErrorCode::Transport),
                              "Error downloading data for " + req.oid +
                                  ": no response received");
    return result;
  }

  const std::string path = handler.file()->path();
  if (!handler.file()->close(err)) {
    discard("close error");
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::LocalClose),
        "can't close tempfile \"" + path + "\": " + err);
    return result;
  }

  const auto &declared = handler.head().content_length;
  if (declared && *declared != handler.written()) {
    diag_.warn("download " + req.oid + ": server declared " +
               std::to_string(*declared) + " bytes, received " +
               std::to_string(handler.written()));
  }
  if (req.size != handler.written()) {
    diag_.debug("download " + req.oid + ": size hint " +
                std::to_string(req.size) + ", received " +
                std::to_string(handler.written()));
  }

  result.response = wire::transfer_ok(req.oid, handler.guard()->release());
  return result;
}

void TransferExecutor::discard(const wire::TransferResponse &response) {
  if (response.path.empty()) {
    return;
  }
  std::string err;
  if (fs_.remove(response.path, err)) {
    diag_.info("removed undelivered download " + response.path);
  } else {
    diag_.error("can't remove undelivered download \"" + response.path +
                "\": " + err);
  }
}

} // namespace transfer
