#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <stdexcept>
#include <stdlib.h>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <gtest/gtest.h>

#include "http/http_client.hpp"
#include "local_fs/local_fs.hpp"
#include "transfer/progress_sink.hpp"

namespace test_support {

// ---------------------------------------------------------------------------
// Scratch directory removed with its contents on destruction
// ---------------------------------------------------------------------------
class TempDir {
public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "relay_adapter_test_XXXXXX")
            .string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = buf.data();
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::string &path() const { return path_; }

  std::vector<std::string> files() const {
    std::vector<std::string> out;
    for (const auto &entry : std::filesystem::directory_iterator(path_)) {
      out.push_back(entry.path().string());
    }
    return out;
  }

  std::string write_file(const std::string &name, const std::string &content) const {
    const std::string p = (std::filesystem::path(path_) / name).string();
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }

private:
  std::string path_;
};

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// ---------------------------------------------------------------------------
// Progress sink that records every report
// ---------------------------------------------------------------------------
struct ProgressEvent {
  std::string oid;
  int64_t bytes_so_far;
  int64_t bytes_since_last;
};

class RecordingProgressSink : public transfer::ProgressSink {
public:
  void report(const std::string &oid, int64_t bytes_so_far,
              int64_t bytes_since_last) override {
    events.push_back({oid, bytes_so_far, bytes_since_last});
  }

  std::vector<ProgressEvent> events;
};

// ---------------------------------------------------------------------------
// Scripted HTTP client: records requests and uploaded bodies
// ---------------------------------------------------------------------------
struct MockExchange {
  std::string construction_error; // non-empty => prepare() fails
  bool transport_error = false;
  std::string transport_message = "Couldn't connect to server";
  long status = 200;
  std::optional<int64_t> content_length;
  std::vector<std::string> body_chunks;
};

class MockHttpClient : public http::HttpClient {
public:
  std::unique_ptr<http::HttpCall> prepare(const http::HttpRequest &req,
                                          std::string &err) override;

  MockExchange next;
  std::size_t read_buffer_size = 16 * 1024;

  std::vector<http::HttpRequest> requests;
  std::string uploaded;
  int performed = 0;
};

class MockHttpCall : public http::HttpCall {
public:
  explicit MockHttpCall(MockHttpClient &client) : client_(client) {}

  http::HttpResult perform(http::BodySource *body,
                           http::ResponseHandler &handler) override {
    ++client_.performed;
    const MockExchange &ex = client_.next;
    http::HttpResult result;

    if (body != nullptr) {
      std::vector<char> buf(client_.read_buffer_size);
      while (true) {
        const int64_t n = body->read(buf.data(), buf.size());
        if (n < 0) {
          result.kind = http::ResultKind::Aborted;
          result.message = "transfer aborted by caller";
          return result;
        }
        if (n == 0) {
          break;
        }
        client_.uploaded.append(buf.data(), static_cast<std::size_t>(n));
      }
    }

    if (ex.transport_error) {
      result.kind = http::ResultKind::Transport;
      result.message = ex.transport_message;
      return result;
    }

    http::HttpResponseHead head;
    head.status = ex.status;
    head.content_length = ex.content_length;
    result.status = ex.status;

    if (!handler.on_response(head)) {
      result.kind = http::ResultKind::Aborted;
      result.message = "transfer aborted by caller";
      return result;
    }
    for (const auto &chunk : ex.body_chunks) {
      if (!handler.on_body(chunk.data(), chunk.size())) {
        result.kind = http::ResultKind::Aborted;
        result.message = "transfer aborted by caller";
        return result;
      }
    }

    result.kind = http::ResultKind::Ok;
    return result;
  }

private:
  MockHttpClient &client_;
};

inline std::unique_ptr<http::HttpCall>
MockHttpClient::prepare(const http::HttpRequest &req, std::string &err) {
  requests.push_back(req);
  if (!next.construction_error.empty()) {
    err = next.construction_error;
    return nullptr;
  }
  return std::make_unique<MockHttpCall>(*this);
}

// ---------------------------------------------------------------------------
// Real POSIX filesystem with injectable failures
// ---------------------------------------------------------------------------
class FaultyFileSystem : public local_fs::FileSystem {
public:
  std::optional<int64_t> fail_write_after; // bytes accepted before failing
  bool fail_close = false;
  bool fail_create = false;
  bool fail_read = false;

  std::vector<std::string> created;

  std::unique_ptr<local_fs::WritableFile>
  create_temp_file(const std::string &dir, const std::string &prefix,
                   std::string &err) override;

  std::unique_ptr<local_fs::ReadableFile> open_read(const std::string &path,
                                                    std::string &err) override;

  bool remove(const std::string &path, std::string &err) override {
    return real_.remove(path, err);
  }

private:
  local_fs::PosixFileSystem real_;
};

class FaultyWritableFile : public local_fs::WritableFile {
public:
  FaultyWritableFile(std::unique_ptr<local_fs::WritableFile> inner,
                     const FaultyFileSystem &owner)
      : inner_(std::move(inner)), owner_(owner) {}

  const std::string &path() const override { return inner_->path(); }

  bool write(const char *data, std::size_t len, std::string &err) override {
    if (owner_.fail_write_after &&
        written_ + static_cast<int64_t>(len) > *owner_.fail_write_after) {
      err = "No space left on device";
      return false;
    }
    written_ += static_cast<int64_t>(len);
    return inner_->write(data, len, err);
  }

  bool close(std::string &err) override {
    if (!inner_->close(err)) {
      return false;
    }
    if (owner_.fail_close) {
      err = "Input/output error";
      return false;
    }
    return true;
  }

private:
  std::unique_ptr<local_fs::WritableFile> inner_;
  const FaultyFileSystem &owner_;
  int64_t written_ = 0;
};

class FaultyReadableFile : public local_fs::ReadableFile {
public:
  explicit FaultyReadableFile(std::unique_ptr<local_fs::ReadableFile> inner)
      : inner_(std::move(inner)) {}

  const std::string &path() const override { return inner_->path(); }

  int64_t read(char * /*buf*/, std::size_t /*cap*/, std::string &err) override {
    err = "Input/output error";
    return -1;
  }

private:
  std::unique_ptr<local_fs::ReadableFile> inner_;
};

inline std::unique_ptr<local_fs::WritableFile>
FaultyFileSystem::create_temp_file(const std::string &dir,
                                   const std::string &prefix, std::string &err) {
  if (fail_create) {
    err = "Permission denied";
    return nullptr;
  }
  auto inner = real_.create_temp_file(dir, prefix, err);
  if (!inner) {
    return nullptr;
  }
  created.push_back(inner->path());
  return std::make_unique<FaultyWritableFile>(std::move(inner), *this);
}

inline std::unique_ptr<local_fs::ReadableFile>
FaultyFileSystem::open_read(const std::string &path, std::string &err) {
  auto inner = real_.open_read(path, err);
  if (!inner || !fail_read) {
    return inner;
  }
  return std::make_unique<FaultyReadableFile>(std::move(inner));
}

// ---------------------------------------------------------------------------
// Output parsing
// ---------------------------------------------------------------------------
inline google::protobuf::Struct parse_json(const std::string &line) {
  google::protobuf::Struct msg;
  const auto status = google::protobuf::util::JsonStringToMessage(line, &msg);
  EXPECT_TRUE(status.ok()) << status.ToString() << " in: " << line;
  return msg;
}

inline std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

inline std::string field_string(const google::protobuf::Struct &msg,
                                const std::string &key) {
  const auto it = msg.fields().find(key);
  return it == msg.fields().end() ? std::string() : it->second.string_value();
}

inline double field_number(const google::protobuf::Struct &msg,
                           const std::string &key) {
  const auto it = msg.fields().find(key);
  return it == msg.fields().end() ? -1.0 : it->second.number_value();
}

inline bool has_field(const google::protobuf::Struct &msg,
                      const std::string &key) {
  return msg.fields().find(key) != msg.fields().end();
}

} // namespace test_support
