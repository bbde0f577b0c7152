#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace netvisor::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;  // 0 when no response was received
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

using ResponseCallback = std::function<void(HttpResponse)>;

// Outbound request seam. HttpClient is the production implementation.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // The callback runs exactly once, on an io_context thread or inline for
  // requests rejected before any I/O.
  virtual void request(const std::string &url, const HttpOptions &options, ResponseCallback callback) = 0;

  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options);

  std::future<HttpResponse> post_json(const std::string &url, const std::string &body, std::chrono::seconds timeout);
};

// Async HTTP client using ASIO.
// Every request owns its resolver, socket and timeout timer, so concurrent
// requests never serialize against each other.
class HttpClient : public HttpTransport {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient() override;

  using HttpTransport::request;

  void request(const std::string &url, const HttpOptions &options, ResponseCallback callback) override;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;  // IPv6 literals without brackets
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  // Host as written in a Host header (IPv6 literals bracketed)
  std::string host_header() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

}  // namespace netvisor::net
