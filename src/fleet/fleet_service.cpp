#include "fleet/fleet_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/api_key.hpp"

namespace netvisor {

FleetService::FleetService(std::shared_ptr<DaemonStore> store, std::shared_ptr<net::HttpTransport> transport, FleetOptions options, Clock clock)
    : store_(std::move(store)), transport_(std::move(transport)), options_(options), clock_(std::move(clock)) {}

std::string FleetService::stored_key(const std::string &api_key) const {
  return options_.hash_api_keys ? hash_api_key(api_key) : api_key;
}

// --- Lifecycle ---

Result<Daemon> FleetService::register_daemon(Daemon daemon) {
  auto now = clock_();
  daemon.registered_at = now;
  daemon.last_seen = now;
  daemon.api_key = stored_key(daemon.api_key);

  auto status = store_->create(daemon);
  if (status.failed()) {
    spdlog::warn("Failed to register daemon {} on host {}: {}", daemon.id, daemon.host_id, status.error->describe());
    return Result<Daemon>::failure(*status.error);
  }

  spdlog::info("Registered daemon {} on host {} ({}:{}) in network {}", daemon.id, daemon.host_id, daemon.ip.to_string(), daemon.port,
               daemon.network_id);
  return Result<Daemon>::success(std::move(daemon));
}

Result<std::optional<Daemon>> FleetService::get_daemon(const DaemonId &id) {
  return store_->get_by_id(id);
}

Result<std::optional<Daemon>> FleetService::get_daemon_by_host(const HostId &host_id) {
  return store_->get_by_host_id(host_id);
}

Result<std::optional<Daemon>> FleetService::get_daemon_by_api_key(const std::string &api_key) {
  return store_->get_by_api_key_hash(stored_key(api_key));
}

Result<std::vector<Daemon>> FleetService::list_daemons(const std::set<NetworkId> &network_ids) {
  return store_->get_all(network_ids);
}

Result<Daemon> FleetService::update_daemon(const Daemon &daemon) {
  auto updated = store_->update(daemon);
  if (updated.failed()) {
    spdlog::warn("Failed to update daemon {}: {}", daemon.id, updated.error->describe());
  }
  return updated;
}

Status FleetService::delete_daemon(const DaemonId &id) {
  auto status = store_->remove(id);
  if (status.ok()) {
    spdlog::info("Deleted daemon {}", id);
  }
  return status;
}

Result<Daemon> FleetService::receive_heartbeat(const Daemon &daemon) {
  const auto &id = daemon.id;
  auto updated = store_->touch(id, clock_());
  if (updated.is(ErrorKind::NotFound)) {
    return Result<Daemon>::failure(ErrorKind::NotFound, "Heartbeat from unknown daemon " + id);
  }
  if (updated.failed()) {
    spdlog::warn("Failed to record heartbeat of daemon {}: {}", id, updated.error->describe());
  } else {
    spdlog::debug("Heartbeat from daemon {}", id);
  }
  return updated;
}

// --- Dispatch ---

Endpoint FleetService::endpoint_for(const Daemon &daemon, const std::string &path) const {
  Endpoint endpoint;
  endpoint.ip = daemon.ip;
  endpoint.port = daemon.port;
  endpoint.protocol = options_.protocol;
  endpoint.path = path;
  return endpoint;
}

void FleetService::send(const Daemon &daemon, const std::string &path, const json &body, const std::string &action, const SessionId &session_id,
                        DispatchCallback callback) {
  auto url = endpoint_for(daemon, path).to_url();
  auto context = "Failed to send " + action + " to daemon " + daemon.id + " for session " + session_id;

  net::HttpOptions options;
  options.method = "POST";
  options.body = body.dump();
  options.timeout = options_.dispatch_timeout;
  options.headers["Content-Type"] = "application/json";
  options.headers["Accept"] = "application/json";

  transport_->request(url, options, [callback = std::move(callback), context, action, daemon_id = daemon.id, session_id](net::HttpResponse response) {
    if (response.status_code == 0) {
      spdlog::warn("{}: {}", context, response.error);
      callback(Status::failure(ErrorKind::TransportFailure, context + ": " + response.error));
      return;
    }

    if (!response.ok()) {
      spdlog::warn("{}: HTTP {}", context, response.status_code);
      callback(Status::failure(ErrorKind::RemoteRejected, context + ": HTTP " + std::to_string(response.status_code)));
      return;
    }

    auto envelope = ApiResponse::parse(response.body);
    if (envelope.failed()) {
      spdlog::warn("{}: {}", context, envelope.error->message);
      callback(Status::failure(ErrorKind::SerializationFailure, context + ": " + envelope.error->message));
      return;
    }

    if (!envelope.value->success) {
      auto reason = envelope.value->error.value_or("Unknown error");
      spdlog::warn("{}: {}", context, reason);
      callback(Status::failure(ErrorKind::RemoteRejected, context + ": " + reason));
      return;
    }

    spdlog::info("{} sent to daemon {} for session {}", action, daemon_id, session_id);
    callback(Status::success());
  });
}

void FleetService::dispatch_discovery(const Daemon &daemon, const DiscoveryRequest &request, DispatchCallback callback) {
  send(daemon, routes::kDiscoveryInitiate, request.to_json(), "discovery request", request.session_id, std::move(callback));
}

std::future<Status> FleetService::dispatch_discovery(const Daemon &daemon, const DiscoveryRequest &request) {
  auto promise = std::make_shared<std::promise<Status>>();
  auto future = promise->get_future();

  dispatch_discovery(daemon, request, [promise](Status status) {
    promise->set_value(std::move(status));
  });

  return future;
}

void FleetService::dispatch_cancellation(const Daemon &daemon, const SessionId &session_id, DispatchCallback callback) {
  send(daemon, routes::kDiscoveryCancel, CancellationRequest{session_id}.to_json(), "discovery cancellation", session_id, std::move(callback));
}

std::future<Status> FleetService::dispatch_cancellation(const Daemon &daemon, const SessionId &session_id) {
  auto promise = std::make_shared<std::promise<Status>>();
  auto future = promise->get_future();

  dispatch_cancellation(daemon, session_id, [promise](Status status) {
    promise->set_value(std::move(status));
  });

  return future;
}

}  // namespace netvisor
