#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "daemon/daemon.hpp"
#include "net/http_client.hpp"

namespace netvisor::testing {

// Manually advanced clock
class FakeClock {
 public:
  FakeClock() : now_(std::make_shared<Timestamp>(from_epoch_ms(1700000000000))) {}

  Clock clock() const {
    auto now = now_;
    return [now]() {
      return *now;
    };
  }

  Timestamp now() const {
    return *now_;
  }

  void advance(std::chrono::milliseconds delta) {
    *now_ += delta;
  }

 private:
  std::shared_ptr<Timestamp> now_;
};

inline Daemon make_daemon(const std::string &id, const std::string &host_id, const std::string &network_id = "net-1",
                          const std::string &ip = "10.0.0.5", uint16_t port = 60073) {
  Daemon daemon;
  daemon.id = id;
  daemon.host_id = host_id;
  daemon.ip = asio::ip::make_address(ip);
  daemon.port = port;
  daemon.network_id = network_id;
  daemon.api_key = "key-" + id;
  return daemon;
}

inline net::HttpResponse http_reply(int status, const std::string &body) {
  net::HttpResponse response;
  response.status_code = status;
  response.body = body;
  return response;
}

inline net::HttpResponse transport_error(const std::string &error) {
  net::HttpResponse response;
  response.error = error;
  return response;
}

// Scripted HttpTransport. Replies are consumed in order; with hold() set the
// callbacks are parked until release() so tests can interleave other calls.
class StubTransport : public net::HttpTransport {
 public:
  struct Call {
    std::string url;
    net::HttpOptions options;
  };

  using net::HttpTransport::request;

  void request(const std::string &url, const net::HttpOptions &options, net::ResponseCallback callback) override {
    net::HttpResponse response = http_reply(200, R"({"success":true,"error":null,"data":null})");
    bool park = false;
    {
      std::lock_guard lock(mutex_);
      calls_.push_back(Call{url, options});
      if (!replies_.empty()) {
        response = replies_.front();
        replies_.pop_front();
      }
      park = hold_;
      if (park) {
        parked_.emplace_back(std::move(callback), response);
      }
    }
    if (!park) {
      callback(response);
    }
  }

  void reply(net::HttpResponse response) {
    std::lock_guard lock(mutex_);
    replies_.push_back(std::move(response));
  }

  void hold(bool hold) {
    std::lock_guard lock(mutex_);
    hold_ = hold;
  }

  // Completes the oldest parked request
  bool release() {
    std::pair<net::ResponseCallback, net::HttpResponse> next;
    {
      std::lock_guard lock(mutex_);
      if (parked_.empty()) return false;
      next = std::move(parked_.front());
      parked_.pop_front();
    }
    next.first(next.second);
    return true;
  }

  std::vector<Call> calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::deque<net::HttpResponse> replies_;
  std::deque<std::pair<net::ResponseCallback, net::HttpResponse>> parked_;
  bool hold_ = false;
};

}  // namespace netvisor::testing
