#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace http {

namespace {

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

bool is_credential_header(const std::string &name) {
  return iequals(name, "Authorization") ||
         iequals(name, "Proxy-Authorization") || iequals(name, "Cookie");
}

} // namespace

std::optional<std::string>
find_header(const std::map<std::string, std::string> &headers,
            const std::string &name) {
  for (const auto &kv : headers) {
    if (iequals(kv.first, name)) {
      return kv.second;
    }
  }
  return std::nullopt;
}

void remove_header(std::map<std::string, std::string> &headers,
                   const std::string &name) {
  for (auto it = headers.begin(); it != headers.end();) {
    if (iequals(it->first, name)) {
      it = headers.erase(it);
    } else {
      ++it;
    }
  }
}

void set_header(std::map<std::string, std::string> &headers,
                const std::string &name, const std::string &value) {
  remove_header(headers, name);
  headers[name] = value;
}

std::string describe_request(const HttpRequest &req) {
  std::ostringstream out;
  out << req.method << " " << req.url;
  for (const auto &kv : req.headers) {
    out << "\n> " << kv.first << ": "
        << (is_credential_header(kv.first) ? "<redacted>" : kv.second);
  }
  if (req.content_length && !find_header(req.headers, "Content-Length")) {
    out << "\n> Content-Length: " << *req.content_length;
  }
  return out.str();
}

} // namespace http
