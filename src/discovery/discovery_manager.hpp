#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "discovery/session_table.hpp"
#include "fleet/fleet_service.hpp"

namespace netvisor {

// Drives discovery sessions: pairs session table transitions with the fleet
// service's outbound calls. No table lock is held while a call is in flight.
class DiscoveryManager {
 public:
  using SessionCallback = std::function<void(Result<DiscoverySession>)>;

  DiscoveryManager(std::shared_ptr<DiscoverySessionTable> table, std::shared_ptr<FleetService> fleet);

  // Creates the session (generating an id when the request has none), then
  // dispatches it. The callback gets the session once it is Dispatched, or
  // the error that moved it to Failed.
  void start_discovery(const DaemonId &daemon_id, DiscoveryRequest request, SessionCallback callback);
  std::future<Result<DiscoverySession>> start_discovery(const DaemonId &daemon_id, DiscoveryRequest request);

  // Best effort: the session ends Cancelled even if the daemon cannot be told.
  // Cancelling a finished session is a no-op that returns it unchanged.
  void cancel(const SessionId &session_id, SessionCallback callback);
  std::future<Result<DiscoverySession>> cancel(const SessionId &session_id);

  // Entry point for progress/result reports from daemons
  Result<DiscoverySession> advance(const SessionId &session_id, const SessionUpdate &update);

  std::optional<DiscoverySession> get(const SessionId &session_id) const;

  std::vector<DiscoverySession> list_active() const;

 private:
  std::shared_ptr<DiscoverySessionTable> table_;
  std::shared_ptr<FleetService> fleet_;
};

}  // namespace netvisor
