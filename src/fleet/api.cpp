#include "fleet/api.hpp"

namespace netvisor {

std::string Endpoint::to_url() const {
  std::string url = protocol == ApplicationProtocol::Https ? "https://" : "http://";
  if (ip.is_v6()) {
    url += "[" + ip.to_string() + "]";
  } else {
    url += ip.to_string();
  }
  url += ":" + std::to_string(port);
  url += path.empty() || path.front() != '/' ? "/" + path : path;
  return url;
}

json DiscoveryRequest::to_json() const {
  json j = options.is_object() ? options : json::object();
  j["session_id"] = session_id;
  return j;
}

json CancellationRequest::to_json() const {
  return json{{"session_id", session_id}};
}

Result<ApiResponse> ApiResponse::parse(const std::string &body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::exception &e) {
    return Result<ApiResponse>::failure(ErrorKind::SerializationFailure, std::string("Response is not JSON: ") + e.what());
  }

  if (!j.is_object() || !j.contains("success") || !j["success"].is_boolean()) {
    return Result<ApiResponse>::failure(ErrorKind::SerializationFailure, "Response is not an API envelope");
  }

  ApiResponse response;
  response.success = j["success"].get<bool>();
  if (j.contains("error") && j["error"].is_string()) {
    response.error = j["error"].get<std::string>();
  }
  if (j.contains("data")) {
    response.data = j["data"];
  }
  return Result<ApiResponse>::success(std::move(response));
}

}  // namespace netvisor
