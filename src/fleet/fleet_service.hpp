#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "daemon/daemon_store.hpp"
#include "fleet/api.hpp"
#include "net/http_client.hpp"

namespace netvisor {

struct FleetOptions {
  std::chrono::seconds dispatch_timeout{30};
  ApplicationProtocol protocol = ApplicationProtocol::Http;
  // Keep SHA-256 digests of api keys instead of the keys themselves
  bool hash_api_keys = false;
};

// Owns the daemon lifecycle and is the only component that calls out to daemons.
class FleetService {
 public:
  using DispatchCallback = std::function<void(Status)>;

  FleetService(std::shared_ptr<DaemonStore> store, std::shared_ptr<net::HttpTransport> transport, FleetOptions options = {},
               Clock clock = system_clock());

  // The caller supplies a fresh id and api key (see Daemon::create)
  Result<Daemon> register_daemon(Daemon daemon);

  Result<std::optional<Daemon>> get_daemon(const DaemonId &id);
  Result<std::optional<Daemon>> get_daemon_by_host(const HostId &host_id);
  // Authenticates inbound daemon calls
  Result<std::optional<Daemon>> get_daemon_by_api_key(const std::string &api_key);
  Result<std::vector<Daemon>> list_daemons(const std::set<NetworkId> &network_ids);

  // Explicit edit of the registration fields; last_seen and registered_at are kept
  Result<Daemon> update_daemon(const Daemon &daemon);
  Status delete_daemon(const DaemonId &id);

  // Refreshes last_seen of the stored record identified by daemon.id; it never
  // moves backwards. Other fields of `daemon` are ignored.
  Result<Daemon> receive_heartbeat(const Daemon &daemon);

  // POST /api/discovery/initiate. Fails on transport error, non-2xx status or success == false.
  void dispatch_discovery(const Daemon &daemon, const DiscoveryRequest &request, DispatchCallback callback);
  std::future<Status> dispatch_discovery(const Daemon &daemon, const DiscoveryRequest &request);

  // POST /api/discovery/cancel, same success contract
  void dispatch_cancellation(const Daemon &daemon, const SessionId &session_id, DispatchCallback callback);
  std::future<Status> dispatch_cancellation(const Daemon &daemon, const SessionId &session_id);

  const FleetOptions &options() const {
    return options_;
  }

 private:
  Endpoint endpoint_for(const Daemon &daemon, const std::string &path) const;

  void send(const Daemon &daemon, const std::string &path, const json &body, const std::string &action, const SessionId &session_id,
            DispatchCallback callback);

  std::string stored_key(const std::string &api_key) const;

  std::shared_ptr<DaemonStore> store_;
  std::shared_ptr<net::HttpTransport> transport_;
  FleetOptions options_;
  Clock clock_;
};

}  // namespace netvisor
