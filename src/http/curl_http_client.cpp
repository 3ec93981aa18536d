#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace http {

namespace {

struct EasyDeleter {
  void operator()(CURL *h) const { curl_easy_cleanup(h); }
};
struct UrlDeleter {
  void operator()(CURLU *h) const { curl_url_cleanup(h); }
};
struct SlistDeleter {
  void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool is_token(const std::string &s) {
  if (s.empty()) {
    return false;
  }
  for (const unsigned char c : s) {
    if (c <= 0x20 || c >= 0x7f || c == ':' || c == '(' || c == ')' ||
        c == ',' || c == ';' || c == '"' || c == '/' || c == '[' ||
        c == ']' || c == '{' || c == '}') {
      return false;
    }
  }
  return true;
}

bool validate_headers(const std::map<std::string, std::string> &headers,
                      std::string &err) {
  for (const auto &kv : headers) {
    if (!is_token(kv.first)) {
      err = "invalid header name '" + kv.first + "'";
      return false;
    }
    if (kv.second.find_first_of("\r\n") != std::string::npos) {
      err = "invalid value for header '" + kv.first + "'";
      return false;
    }
  }
  return true;
}

class CurlCall : public HttpCall {
public:
  CurlCall(EasyHandle easy, UrlHandle url, HeaderList headers,
           HttpRequest req)
      : easy_(std::move(easy)), url_(std::move(url)),
        headers_(std::move(headers)), req_(std::move(req)) {}

  HttpResult perform(BodySource *body, ResponseHandler &handler) override;

private:
  static size_t write_cb(char *buf, size_t size, size_t n, void *ud);
  static size_t read_cb(char *buf, size_t size, size_t n, void *ud);

  bool start_response();

  EasyHandle easy_;
  UrlHandle url_;
  HeaderList headers_;
  HttpRequest req_;

  BodySource *body_ = nullptr;
  ResponseHandler *handler_ = nullptr;
  HttpResponseHead head_;
  bool started_ = false;
  bool aborted_ = false;
  char errbuf_[CURL_ERROR_SIZE] = {0};
};

bool CurlCall::start_response() {
  started_ = true;

  long status = 0;
  curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status);
  head_.status = status;

  curl_off_t declared = -1;
  if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                        &declared) == CURLE_OK &&
      declared >= 0) {
    head_.content_length = static_cast<int64_t>(declared);
  }

  if (!handler_->on_response(head_)) {
    aborted_ = true;
    return false;
  }
  return true;
}

size_t CurlCall::write_cb(char *buf, size_t size, size_t n, void *ud) {
  auto *self = static_cast<CurlCall *>(ud);
  const size_t len = size * n;

  if (!self->started_ && !self->start_response()) {
    return 0;
  }
  if (len == 0) {
    return 0;
  }
  if (!self->handler_->on_body(buf, len)) {
    self->aborted_ = true;
    return 0;
  }
  return len;
}

size_t CurlCall::read_cb(char *buf, size_t size, size_t n, void *ud) {
  auto *self = static_cast<CurlCall *>(ud);
  if (self->body_ == nullptr) {
    return 0;
  }

  const int64_t got = self->body_->read(buf, size * n);
  if (got < 0) {
    self->aborted_ = true;
    return CURL_READFUNC_ABORT;
  }
  return static_cast<size_t>(got);
}

HttpResult CurlCall::perform(BodySource *body, ResponseHandler &handler) {
  body_ = body;
  handler_ = &handler;
  head_ = HttpResponseHead{};
  started_ = false;
  aborted_ = false;
  errbuf_[0] = '\0';

  CURL *h = easy_.get();
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &CurlCall::write_cb);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, this);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf_);

  const bool has_body = body != nullptr;
  if (req_.method == "GET" && !has_body) {
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
  } else {
    if (has_body) {
      curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
      curl_easy_setopt(h, CURLOPT_READFUNCTION, &CurlCall::read_cb);
      curl_easy_setopt(h, CURLOPT_READDATA, this);
      if (req_.content_length && !req_.chunked) {
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE,
                         static_cast<curl_off_t>(*req_.content_length));
      }
    }
    if (req_.method != "PUT" || !has_body) {
      curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req_.method.c_str());
    }
  }

  const CURLcode rc = curl_easy_perform(h);

  HttpResult result;
  long status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  result.status = status;

  if (aborted_) {
    result.kind = ResultKind::Aborted;
    result.message = "transfer aborted by caller";
    return result;
  }

  if (rc != CURLE_OK) {
    result.kind = ResultKind::Transport;
    result.message = curl_easy_strerror(rc);
    if (errbuf_[0] != '\0') {
      result.message += ": ";
      result.message += errbuf_;
    }
    return result;
  }

  // No body at all: the handler still sees the response head
  if (!started_ && !start_response()) {
    result.kind = ResultKind::Aborted;
    result.message = "transfer aborted by caller";
    return result;
  }

  result.kind = ResultKind::Ok;
  return result;
}

} // namespace

CurlGlobal::CurlGlobal() { ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; }

CurlGlobal::~CurlGlobal() {
  if (ok_) {
    curl_global_cleanup();
  }
}

CurlHttpClient::CurlHttpClient(relay_adapter::HttpConfig config)
    : config_(std::move(config)) {}

std::string CurlHttpClient::version() { return curl_version(); }

std::unique_ptr<HttpCall> CurlHttpClient::prepare(const HttpRequest &req,
                                                  std::string &err) {
  err.clear();

  if (!is_token(req.method)) {
    err = "invalid HTTP method '" + req.method + "'";
    return nullptr;
  }
  if (req.url.empty()) {
    err = "missing URL";
    return nullptr;
  }

  UrlHandle url(curl_url());
  if (!url) {
    err = "out of memory allocating URL handle";
    return nullptr;
  }
  const CURLUcode uc = curl_url_set(url.get(), CURLUPART_URL, req.url.c_str(), 0);
  if (uc != CURLUE_OK) {
    err = "invalid URL '" + req.url + "': " + curl_url_strerror(uc);
    return nullptr;
  }

  char *scheme = nullptr;
  if (curl_url_get(url.get(), CURLUPART_SCHEME, &scheme, 0) != CURLUE_OK ||
      scheme == nullptr) {
    err = "URL '" + req.url + "' has no scheme";
    return nullptr;
  }
  const std::string scheme_str = to_lower(scheme);
  curl_free(scheme);
  if (scheme_str != "http" && scheme_str != "https") {
    err = "unsupported protocol scheme '" + scheme_str + "'";
    return nullptr;
  }

  if (!validate_headers(req.headers, err)) {
    return nullptr;
  }

  EasyHandle easy(curl_easy_init());
  if (!easy) {
    err = "curl_easy_init failed";
    return nullptr;
  }

  HeaderList headers;
  for (const auto &kv : req.headers) {
    // "Name;" is libcurl's spelling of a header with an empty value
    const std::string line =
        kv.second.empty() ? kv.first + ";" : kv.first + ": " + kv.second;
    curl_slist *next = curl_slist_append(headers.get(), line.c_str());
    if (next == nullptr) {
      err = "out of memory building request headers";
      return nullptr;
    }
    headers.release();
    headers.reset(next);
  }

  CURL *h = easy.get();
  curl_easy_setopt(h, CURLOPT_CURLU, url.get());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config_.connect_timeout_ms));
  if (config_.low_speed_time_s > 0) {
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT,
                     static_cast<long>(config_.low_speed_limit_bytes));
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(config_.low_speed_time_s));
  }
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION,
                   config_.follow_redirects ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS,
                   static_cast<long>(config_.max_redirects));
  if (!config_.ca_bundle.empty()) {
    curl_easy_setopt(h, CURLOPT_CAINFO, config_.ca_bundle.c_str());
  }
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);

  return std::make_unique<CurlCall>(std::move(easy), std::move(url),
                                    std::move(headers), req);
}

} // namespace http
