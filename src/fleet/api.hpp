#pragma once

#include <asio/ip/address.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace netvisor {

enum class ApplicationProtocol { Http, Https };

// Network location of a daemon API route
struct Endpoint {
  asio::ip::address ip;
  uint16_t port = 0;
  ApplicationProtocol protocol = ApplicationProtocol::Http;
  std::string path;

  // e.g. http://10.0.0.5:9000/api/discovery/initiate or http://[fd00::1]:9000/...
  std::string to_url() const;
};

namespace routes {
inline constexpr const char *kDiscoveryInitiate = "/api/discovery/initiate";
inline constexpr const char *kDiscoveryCancel = "/api/discovery/cancel";
}  // namespace routes

// Body of POST /api/discovery/initiate
struct DiscoveryRequest {
  SessionId session_id;
  json options = json::object();  // Passed through to the daemon untouched

  json to_json() const;
};

// Body of POST /api/discovery/cancel
struct CancellationRequest {
  SessionId session_id;

  json to_json() const;
};

// Response envelope every daemon route answers with:
// { "success": bool, "error": string|null, "data": T|null }
struct ApiResponse {
  bool success = false;
  std::optional<std::string> error;
  json data;  // null when absent

  static Result<ApiResponse> parse(const std::string &body);
};

}  // namespace netvisor
