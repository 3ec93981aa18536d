#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace http {

// Outgoing request. Headers are sent verbatim.
struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  // Declared body length; unset => no body (or chunked when `chunked`)
  std::optional<int64_t> content_length;
  bool chunked = false;
};

// Status and declared length of the final response (after redirects).
struct HttpResponseHead {
  long status = 0;
  std::optional<int64_t> content_length;
};

enum class ResultKind {
  Ok,        // exchange completed; check status
  Transport, // connection / TLS / timeout / protocol failure
  Aborted    // a handler or body source asked to stop
};

struct HttpResult {
  ResultKind kind = ResultKind::Transport;
  long status = 0; // 0 when no response was received
  std::string message;

  bool ok() const { return kind == ResultKind::Ok; }
};

// Receives the response. Returning false from either call aborts the
// transfer; perform() then reports ResultKind::Aborted.
class ResponseHandler {
public:
  virtual ~ResponseHandler() = default;

  // Called exactly once per completed exchange, before any body bytes.
  virtual bool on_response(const HttpResponseHead &head) = 0;
  virtual bool on_body(const char *data, std::size_t len) = 0;
};

// Supplies the request body.
class BodySource {
public:
  virtual ~BodySource() = default;

  // Fills up to `cap` bytes. Returns the count, 0 at end of body, or
  // -1 to abort the transfer.
  virtual int64_t read(char *buf, std::size_t cap) = 0;
};

// A constructed, ready-to-run request.
class HttpCall {
public:
  virtual ~HttpCall() = default;

  // Runs the exchange. body may be null for requests without a body.
  virtual HttpResult perform(BodySource *body, ResponseHandler &handler) = 0;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  // Validates and builds the request. Returns nullptr and sets err when the
  // request cannot be constructed (bad URL, invalid header, ...).
  virtual std::unique_ptr<HttpCall> prepare(const HttpRequest &req,
                                            std::string &err) = 0;
};

// Case-insensitive header lookup on a request header map.
std::optional<std::string>
find_header(const std::map<std::string, std::string> &headers,
            const std::string &name);

// Sets a header, replacing any existing entry whatever its case.
void set_header(std::map<std::string, std::string> &headers,
                const std::string &name, const std::string &value);

void remove_header(std::map<std::string, std::string> &headers,
                   const std::string &name);

// "METHOD URL" followed by one "Name: value" line per header, for
// diagnostics. Credentials are redacted.
std::string describe_request(const HttpRequest &req);

} // namespace http
