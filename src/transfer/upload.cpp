#include "transfer_executor.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include "error_codes.hpp"

namespace transfer {

namespace {

constexpr const char *kDefaultContentType = "application/octet-stream";

bool is_chunked(const std::map<std::string, std::string> &headers) {
  const auto te = http::find_header(headers, "Transfer-Encoding");
  if (!te) {
    return false;
  }
  std::string value = *te;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "chunked";
}

// Feeds the local file to the HTTP body, reporting progress per chunk.
class FileBodySource : public http::BodySource {
public:
  FileBodySource(const std::string &oid, local_fs::ReadableFile &file,
                 std::size_t chunk_size, int64_t limit, ProgressSink &progress)
      : oid_(oid), file_(file), chunk_size_(std::max<std::size_t>(chunk_size, 1)),
        limit_(limit), progress_(progress) {}

  int64_t read(char *buf, std::size_t cap) override {
    std::size_t want = std::min(cap, chunk_size_);
    if (limit_ >= 0) {
      const int64_t left = limit_ - sent_;
      if (left <= 0) {
        return 0;
      }
      want = static_cast<std::size_t>(
          std::min<int64_t>(static_cast<int64_t>(want), left));
    }

    const int64_t n = file_.read(buf, want, error_);
    if (n < 0) {
      failed_ = true;
      return -1;
    }
    if (n == 0 && limit_ >= 0) {
      // Source ended before the declared Content-Length
      error_ = "unexpected end of file after " + std::to_string(sent_) +
               " of " + std::to_string(limit_) + " bytes";
      failed_ = true;
      return -1;
    }
    if (n > 0) {
      sent_ += n;
      progress_.report(oid_, sent_, n);
    }
    return n;
  }

  bool failed() const { return failed_; }
  const std::string &error() const { return error_; }
  int64_t sent() const { return sent_; }

private:
  const std::string &oid_;
  local_fs::ReadableFile &file_;
  std::size_t chunk_size_;
  int64_t limit_; // -1: read to EOF
  ProgressSink &progress_;

  int64_t sent_ = 0;
  bool failed_ = false;
  std::string error_;
};

// The body is read to the end whatever the status, so the connection can be
// reused.
class DiscardHandler : public http::ResponseHandler {
public:
  bool on_response(const http::HttpResponseHead & /*head*/) override {
    return true;
  }

  bool on_body(const char * /*data*/, std::size_t len) override {
    discarded_ += len;
    return true;
  }

  std::size_t discarded() const { return discarded_; }

private:
  std::size_t discarded_ = 0;
};

} // namespace

TransferResult TransferExecutor::upload(const wire::UploadRequest &req,
                                        ProgressSink &progress) {
  TransferResult result;

  http::HttpRequest request;
  request.method = "PUT";
  request.url = req.action.href;
  request.headers = req.action.header;

  if (!http::find_header(request.headers, "Content-Type")) {
    http::set_header(request.headers, "Content-Type", kDefaultContentType);
  }

  if (is_chunked(request.headers)) {
    request.chunked = true;
    http::remove_header(request.headers, "Content-Length");
  } else {
    http::set_header(request.headers, "Content-Length",
                     std::to_string(req.size));
    request.content_length = req.size;
  }

  std::string err;
  auto call = client_.prepare(request, err);
  if (!call) {
    result.response =
        wire::transfer_failed(req.oid, to_wire(ErrorCode::RequestConstruction), err);
    return result;
  }

  auto file = fs_.open_read(req.path, err);
  if (!file) {
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::LocalRead),
        "Cannot read data from \"" + req.path + "\": " + err);
    return result;
  }

  FileBodySource body(req.oid, *file, config_.chunk_size,
                      request.chunked ? -1 : req.size, progress);
  DiscardHandler handler;
  const http::HttpResult http_result = call->perform(&body, handler);
  result.bytes = body.sent();

  if (body.failed()) {
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::LocalRead),
        "Cannot read data from \"" + req.path + "\": " + body.error());
    return result;
  }

  if (!http_result.ok()) {
    result.response = wire::transfer_failed(
        req.oid, to_wire(ErrorCode::Transport),
        "Error uploading data for " + req.oid + ": " + http_result.message);
    return result;
  }

  const long status = http_result.status;
  if (is_failure_status(status)) {
    result.response = wire::transfer_failed(
        req.oid, remote_status_code(status),
        "Invalid status for " + http::describe_request(request) + ": " +
            std::to_string(status));
    return result;
  }

  if (handler.discarded() > 0) {
    diag_.debug("upload " + req.oid + ": discarded " +
                std::to_string(handler.discarded()) + " response bytes");
  }

  result.response = wire::transfer_ok(req.oid);
  return result;
}

} // namespace transfer
