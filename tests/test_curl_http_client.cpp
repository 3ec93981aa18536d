#include <gtest/gtest.h>

#include <string>

#include "config.hpp"
#include "http/curl_http_client.hpp"

namespace {

class NeverCalledHandler : public http::ResponseHandler {
public:
  bool on_response(const http::HttpResponseHead & /*head*/) override {
    ++responses;
    return true;
  }
  bool on_body(const char * /*data*/, std::size_t /*len*/) override {
    ++bodies;
    return true;
  }

  int responses = 0;
  int bodies = 0;
};

class CurlHttpClientTest : public ::testing::Test {
protected:
  CurlHttpClientTest() : client_(make_config()) {}

  static relay_adapter::HttpConfig make_config() {
    relay_adapter::HttpConfig config;
    config.connect_timeout_ms = 2000;
    return config;
  }

  static http::HttpRequest get(const std::string &url) {
    http::HttpRequest req;
    req.method = "GET";
    req.url = url;
    return req;
  }

  std::string prepare_error(const http::HttpRequest &req) {
    std::string err;
    auto call = client_.prepare(req, err);
    EXPECT_EQ(call, nullptr);
    return err;
  }

  http::CurlGlobal global_;
  http::CurlHttpClient client_;
};

TEST_F(CurlHttpClientTest, GlobalInitSucceeds) { EXPECT_TRUE(global_.ok()); }

TEST_F(CurlHttpClientTest, RejectsEmptyUrl) {
  EXPECT_EQ(prepare_error(get("")), "missing URL");
}

TEST_F(CurlHttpClientTest, RejectsMalformedUrl) {
  const std::string err = prepare_error(get("http://[::1"));
  EXPECT_NE(err.find("invalid URL"), std::string::npos) << err;
}

TEST_F(CurlHttpClientTest, RejectsUnsupportedScheme) {
  const std::string err = prepare_error(get("ftp://example.com/obj"));
  EXPECT_NE(err.find("unsupported protocol scheme 'ftp'"), std::string::npos)
      << err;
}

TEST_F(CurlHttpClientTest, RejectsInvalidMethod) {
  auto req = get("http://127.0.0.1:1/obj");
  req.method = "GE T";
  EXPECT_NE(prepare_error(req).find("invalid HTTP method"), std::string::npos);
}

TEST_F(CurlHttpClientTest, RejectsHeaderValueWithNewline) {
  auto req = get("http://127.0.0.1:1/obj");
  req.headers["X-Injected"] = "a\r\nHost: evil";
  EXPECT_NE(prepare_error(req).find("invalid value for header 'X-Injected'"),
            std::string::npos);
}

TEST_F(CurlHttpClientTest, RejectsHeaderNameWithColon) {
  auto req = get("http://127.0.0.1:1/obj");
  req.headers["Bad:Name"] = "x";
  EXPECT_NE(prepare_error(req).find("invalid header name"), std::string::npos);
}

TEST_F(CurlHttpClientTest, PreparesValidRequest) {
  auto req = get("https://example.com/objects/abc?x=1");
  req.headers["Authorization"] = "Basic Zm9v";
  req.headers["X-Empty"] = "";

  std::string err;
  auto call = client_.prepare(req, err);
  EXPECT_NE(call, nullptr) << err;
  EXPECT_TRUE(err.empty());
}

TEST_F(CurlHttpClientTest, ConnectionRefusedIsTransportError) {
  std::string err;
  auto call = client_.prepare(get("http://127.0.0.1:1/obj"), err);
  ASSERT_NE(call, nullptr) << err;

  NeverCalledHandler handler;
  const http::HttpResult result = call->perform(nullptr, handler);

  EXPECT_EQ(result.kind, http::ResultKind::Transport);
  EXPECT_FALSE(result.ok());
  EXPECT_FALSE(result.message.empty());
  EXPECT_EQ(handler.responses, 0);
  EXPECT_EQ(handler.bodies, 0);
}

TEST(CurlVersion, ReportsLibcurl) {
  EXPECT_NE(http::CurlHttpClient::version().find("libcurl"), std::string::npos);
}

} // namespace
