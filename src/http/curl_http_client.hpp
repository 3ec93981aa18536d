#pragma once

#include <memory>
#include <string>

#include "../config.hpp"
#include "http_client.hpp"

namespace http {

// Owns curl_global_init/curl_global_cleanup for the process lifetime.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal &) = delete;
  CurlGlobal &operator=(const CurlGlobal &) = delete;

  bool ok() const { return ok_; }

private:
  bool ok_ = false;
};

// HttpClient backed by libcurl's easy interface. One easy handle per call;
// calls run synchronously on the caller's thread.
class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(relay_adapter::HttpConfig config);

  std::unique_ptr<HttpCall> prepare(const HttpRequest &req,
                                    std::string &err) override;

  // Library version string, for the startup banner
  static std::string version();

private:
  relay_adapter::HttpConfig config_;
};

} // namespace http
