#include "session.hpp"

#include <variant>

#include "../transfer/progress_reporter.hpp"
#include "../transport/line_stdio.hpp"
#include "../wire/codec.hpp"

namespace session {

namespace {

constexpr std::size_t kMaxLoggedLine = 256;

bool is_blank(const std::string &line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Parser messages may span several lines; diagnostics are one line each.
std::string single_line(std::string text) {
  for (char &c : text) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return text;
}

std::string excerpt(const std::string &line) {
  if (line.size() <= kMaxLoggedLine) {
    return line;
  }
  return line.substr(0, kMaxLoggedLine) + "... (" +
         std::to_string(line.size()) + " bytes)";
}

} // namespace

const char *state_name(State state) {
  switch (state) {
  case State::Uninitialized:
    return "uninitialized";
  case State::Ready:
    return "ready";
  case State::Terminated:
    return "terminated";
  }
  return "unknown";
}

Session::Session(std::istream &in, std::ostream &out,
                 relay_adapter::Diagnostics &diag,
                 transfer::TransferExecutor &executor)
    : in_(in), diag_(diag), executor_(executor), writer_(out, diag) {}

int Session::run() {
  std::string line;
  std::string io_err;

  while (state_ != State::Terminated) {
    if (!transport::read_line(in_, line, io_err)) {
      if (io_err.empty()) {
        diag_.info("EOF on stdin; exiting cleanly");
        break;
      }
      if (transport::is_recoverable(in_)) {
        ++stats_.malformed;
        diag_.error("Unable to read request: " + io_err);
        continue;
      }
      diag_.error("read_line error: " + io_err);
      log_stats();
      return 2;
    }

    dispatch_line(line);
  }

  log_stats();
  return 0;
}

void Session::dispatch_line(const std::string &line) {
  if (is_blank(line)) {
    return;
  }

  wire::Request req;
  std::string err;
  const wire::DecodeStatus status = wire::decode_request(line, req, err);
  if (status != wire::DecodeStatus::Ok) {
    ++stats_.malformed;
    diag_.error(std::string("Unable to parse request (") +
                wire::decode_status_name(status) + ": " + single_line(err) +
                "): " + excerpt(line));
    return;
  }

  ++stats_.requests;
  diag_.debug("received " + excerpt(line));

  if (const auto *init = std::get_if<wire::InitRequest>(&req)) {
    handle_init(*init);
  } else if (const auto *download = std::get_if<wire::DownloadRequest>(&req)) {
    handle_download(*download);
  } else if (const auto *upload = std::get_if<wire::UploadRequest>(&req)) {
    handle_upload(*upload);
  } else {
    handle_terminate();
  }
}

void Session::handle_init(const wire::InitRequest &req) {
  if (state_ == State::Ready) {
    diag_.warn("init received again (previous operation: " + operation_ + ")");
  }

  operation_ = req.operation;
  state_ = State::Ready;

  std::string msg = "Initialised custom adapter for " + req.operation;
  if (req.concurrent) {
    msg += " (concurrent, " + std::to_string(req.concurrent_transfers) +
           " transfers)";
  }
  diag_.info(msg);

  writer_.send(wire::InitResponse{});
}

void Session::handle_download(const wire::DownloadRequest &req) {
  warn_if_uninitialized("download");
  diag_.info("Received download request for " + req.oid);

  transfer::ProgressReporter progress(writer_);
  const transfer::TransferResult result = executor_.download(req, progress);

  if (result.response.ok()) {
    ++stats_.downloads_ok;
  } else {
    ++stats_.downloads_failed;
  }
  stats_.bytes_downloaded += result.bytes;
  log_outcome("download", result);

  if (!writer_.send(result.response)) {
    executor_.discard(result.response);
  }
}

void Session::handle_upload(const wire::UploadRequest &req) {
  warn_if_uninitialized("upload");
  diag_.info("Received upload request for " + req.oid);

  transfer::ProgressReporter progress(writer_);
  const transfer::TransferResult result = executor_.upload(req, progress);

  if (result.response.ok()) {
    ++stats_.uploads_ok;
  } else {
    ++stats_.uploads_failed;
  }
  stats_.bytes_uploaded += result.bytes;
  log_outcome("upload", result);

  writer_.send(result.response);
}

void Session::handle_terminate() {
  diag_.info("Terminating custom adapter gracefully.");
  state_ = State::Terminated;
}

// Ordering is not enforced: a transfer before init is still served.
void Session::warn_if_uninitialized(const char *command) {
  if (state_ == State::Uninitialized) {
    diag_.warn(std::string(command) + " request before init; handling anyway");
  }
}

void Session::log_outcome(const char *command,
                          const transfer::TransferResult &result) {
  const auto &resp = result.response;
  if (resp.ok()) {
    std::string msg = std::string(command) + " " + resp.oid + " complete (" +
                      std::to_string(result.bytes) + " bytes)";
    if (!resp.path.empty()) {
      msg += " -> " + resp.path;
    }
    diag_.info(msg);
  } else {
    diag_.error(std::string(command) + " " + resp.oid + " failed [" +
                std::to_string(resp.error->code) + "]: " +
                resp.error->message);
  }
}

void Session::log_stats() {
  diag_.info("session " + std::string(state_name(state_)) + ": " +
             std::to_string(stats_.requests) + " requests, " +
             std::to_string(stats_.malformed) + " malformed, downloads " +
             std::to_string(stats_.downloads_ok) + " ok/" +
             std::to_string(stats_.downloads_failed) + " failed (" +
             std::to_string(stats_.bytes_downloaded) + " bytes), uploads " +
             std::to_string(stats_.uploads_ok) + " ok/" +
             std::to_string(stats_.uploads_failed) + " failed (" +
             std::to_string(stats_.bytes_uploaded) + " bytes)");
}

} // namespace session
