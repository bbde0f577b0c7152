#include "net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

namespace netvisor::net {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string build_request(const ParsedUrl &url, const HttpOptions &options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host_header() << "\r\n";
  req << "Connection: close\r\n";

  for (const auto &[key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST" || options.method == "PUT") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// Decodes a complete chunked body. Returns false if the framing is broken.
bool decode_chunked(const std::string &raw, std::string &out) {
  size_t pos = 0;
  out.clear();
  while (pos < raw.size()) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) return false;

    size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(raw.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception &) {
      return false;
    }

    pos = line_end + 2;
    if (chunk_size == 0) return true;
    if (chunk_size > raw.size() - pos) return false;

    out.append(raw, pos, chunk_size);
    pos += chunk_size + 2;
  }
  return false;
}

std::optional<size_t> content_length(const HttpResponse &response) {
  auto it = response.headers.find("content-length");
  if (it == response.headers.end()) return std::nullopt;
  try {
    return static_cast<size_t>(std::stoull(it->second));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void drain(asio::streambuf &buffer, std::string &into) {
  if (buffer.size() == 0) return;
  auto data = buffer.data();
  into.append(asio::buffers_begin(data), asio::buffers_end(data));
  buffer.consume(buffer.size());
}

}  // namespace

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  // Host is either a bracketed IPv6 literal or a name/IPv4 address
  static const std::regex url_regex(R"(^(https?):\/\/(\[[0-9A-Fa-f:.]+\]|[^:\/\s\[\]]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?$)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  if (result.host.front() == '[') {
    result.host = result.host.substr(1, result.host.size() - 2);
  }
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ParsedUrl::host_header() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (!port.empty()) h += ":" + port;
  return h;
}

// --- HttpTransport ---

std::future<HttpResponse> HttpTransport::request(const std::string &url, const HttpOptions &options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

std::future<HttpResponse> HttpTransport::post_json(const std::string &url, const std::string &body, std::chrono::seconds timeout) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.timeout = timeout;
  options.headers["Content-Type"] = "application/json";
  options.headers["Accept"] = "application/json";
  return request(url, options);
}

// --- HttpClient ---

class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context &io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string &url, const HttpOptions &options, ResponseCallback callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL: " + url});
      return;
    }

    // All handlers of one exchange run on its own strand
    auto strand = asio::make_strand(io_ctx_);

    if (parsed->is_https()) {
      auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(strand, ssl_ctx_);
      // Set SNI hostname
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start(std::make_shared<Exchange<asio::ssl::stream<asio::ip::tcp::socket>>>(strand, socket, std::move(callback)), *parsed, options);
    } else {
      auto socket = std::make_shared<asio::ip::tcp::socket>(strand);
      start(std::make_shared<Exchange<asio::ip::tcp::socket>>(strand, socket, std::move(callback)), *parsed, options);
    }
  }

 private:
  using Strand = asio::strand<asio::io_context::executor_type>;

  // State of one request/response round trip
  template <typename Socket>
  struct Exchange {
    Exchange(const Strand &strand, std::shared_ptr<Socket> s, ResponseCallback cb)
        : socket(std::move(s)), resolver(strand), timer(strand), callback(std::move(cb)) {}

    std::shared_ptr<Socket> socket;
    asio::ip::tcp::resolver resolver;
    asio::steady_timer timer;
    asio::streambuf buffer;
    std::string request;
    HttpResponse response;
    bool chunked = false;
    bool timed_out = false;
    bool done = false;
    ResponseCallback callback;

    void fail(const std::string &what, const asio::error_code &ec) {
      response.status_code = 0;
      response.error = what + ": " + ec.message();
      finish();
    }

    void finish() {
      if (done) return;
      done = true;
      timer.cancel();

      asio::error_code ignored;
      socket->lowest_layer().close(ignored);

      if (timed_out) {
        response.status_code = 0;
        response.error = "Request timed out";
      } else if (chunked) {
        std::string decoded;
        if (decode_chunked(response.body, decoded)) {
          response.body = std::move(decoded);
        } else {
          response.error = "Malformed chunked response body";
        }
      }
      callback(std::move(response));
    }
  };

  template <typename Socket>
  using ExchangePtr = std::shared_ptr<Exchange<Socket>>;

  template <typename Socket>
  void start(ExchangePtr<Socket> ex, const ParsedUrl &url, const HttpOptions &options) {
    ex->request = build_request(url, options);

    // When the timer fires the socket is closed and the pending operation aborts
    ex->timer.expires_after(options.timeout);
    ex->timer.async_wait([ex](const asio::error_code &ec) {
      if (ec || ex->done) return;
      ex->timed_out = true;
      asio::error_code ignored;
      ex->resolver.cancel();
      ex->socket->lowest_layer().close(ignored);
    });

    ex->resolver.async_resolve(url.host, url.port_or_default(),
                               [this, ex](const asio::error_code &ec, asio::ip::tcp::resolver::results_type results) {
                                 if (ec) {
                                   ex->fail("DNS resolution failed", ec);
                                   return;
                                 }
                                 connect(ex, results);
                               });
  }

  template <typename Socket>
  void connect(ExchangePtr<Socket> ex, const asio::ip::tcp::resolver::results_type &results) {
    asio::async_connect(ex->socket->lowest_layer(), results, [this, ex](const asio::error_code &ec, const asio::ip::tcp::endpoint &) {
      if (ec) {
        ex->fail("Connection failed", ec);
        return;
      }

      if constexpr (std::is_same_v<Socket, asio::ip::tcp::socket>) {
        write(ex);
      } else {
        ex->socket->async_handshake(asio::ssl::stream_base::client, [this, ex](const asio::error_code &ec) {
          if (ec) {
            ex->fail("SSL handshake failed", ec);
            return;
          }
          write(ex);
        });
      }
    });
  }

  template <typename Socket>
  void write(ExchangePtr<Socket> ex) {
    asio::async_write(*ex->socket, asio::buffer(ex->request), [this, ex](const asio::error_code &ec, size_t) {
      if (ec) {
        ex->fail("Write failed", ec);
        return;
      }
      read_headers(ex);
    });
  }

  template <typename Socket>
  void read_headers(ExchangePtr<Socket> ex) {
    asio::async_read_until(*ex->socket, ex->buffer, "\r\n\r\n", [this, ex](const asio::error_code &ec, size_t header_bytes) {
      if (ec) {
        ex->fail("Read headers failed", ec);
        return;
      }

      std::string head(asio::buffers_begin(ex->buffer.data()), asio::buffers_begin(ex->buffer.data()) + header_bytes);
      ex->buffer.consume(header_bytes);

      std::istringstream stream(head);
      std::string status_line;
      std::getline(stream, status_line);

      static const std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
      std::smatch match;
      if (!std::regex_search(status_line, match, status_regex)) {
        ex->response.error = "Invalid HTTP response: cannot parse status line";
        ex->finish();
        return;
      }
      ex->response.status_code = std::stoi(match[1].str());

      std::string header_line;
      while (std::getline(stream, header_line) && header_line != "\r") {
        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = to_lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        ex->response.headers[key] = value;
      }

      auto te = ex->response.headers.find("transfer-encoding");
      ex->chunked = te != ex->response.headers.end() && to_lower(te->second).find("chunked") != std::string::npos;

      read_body(ex);
    });
  }

  template <typename Socket>
  void read_body(ExchangePtr<Socket> ex) {
    drain(ex->buffer, ex->response.body);

    auto expected = content_length(ex->response);
    if (!ex->chunked && expected && ex->response.body.size() >= *expected) {
      ex->response.body.resize(*expected);
      ex->finish();
      return;
    }

    asio::async_read(*ex->socket, ex->buffer, asio::transfer_at_least(1), [this, ex](const asio::error_code &ec, size_t) {
      // SSL peers frequently close without close_notify
      bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

      if (ec && !is_eof) {
        ex->fail("Read body failed", ec);
        return;
      }

      if (is_eof) {
        drain(ex->buffer, ex->response.body);
        auto expected = content_length(ex->response);
        if (expected && ex->response.body.size() < *expected) {
          ex->response.error = "Connection closed before full body was received";
        }
        ex->finish();
        return;
      }

      read_body(ex);
    });
  }

  asio::io_context &io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context &io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string &url, const HttpOptions &options, ResponseCallback callback) {
  spdlog::debug("HTTP {} {}", options.method, url);
  impl_->request(url, options, std::move(callback));
}

}  // namespace netvisor::net
