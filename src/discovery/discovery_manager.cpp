#include "discovery/discovery_manager.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace netvisor {

namespace {

template <typename Fn>
std::future<Result<DiscoverySession>> to_future(Fn &&start) {
  auto promise = std::make_shared<std::promise<Result<DiscoverySession>>>();
  auto future = promise->get_future();
  start([promise](Result<DiscoverySession> result) {
    promise->set_value(std::move(result));
  });
  return future;
}

void mark_failed(DiscoverySessionTable &table, const SessionId &session_id, const std::string &reason) {
  auto failed = table.advance(session_id, SessionUpdate::failed(reason));
  if (failed.failed()) {
    spdlog::warn("Could not mark discovery session {} failed: {}", session_id, failed.error->message);
  }
}

}  // namespace

DiscoveryManager::DiscoveryManager(std::shared_ptr<DiscoverySessionTable> table, std::shared_ptr<FleetService> fleet)
    : table_(std::move(table)), fleet_(std::move(fleet)) {}

void DiscoveryManager::start_discovery(const DaemonId &daemon_id, DiscoveryRequest request, SessionCallback callback) {
  if (request.session_id.empty()) {
    request.session_id = UUID::generate();
  }
  auto session_id = request.session_id;

  auto created = table_->create(session_id, daemon_id);
  if (created.failed()) {
    callback(Result<DiscoverySession>::failure(*created.error));
    return;
  }

  auto fail = [this, &session_id, &callback](const Error &error) {
    mark_failed(*table_, session_id, error.message);
    callback(Result<DiscoverySession>::failure(error));
  };

  auto daemon = fleet_->get_daemon(daemon_id);
  if (daemon.failed()) {
    fail(*daemon.error);
    return;
  }
  if (!daemon.value->has_value()) {
    fail(Error{ErrorKind::NotFound, "Daemon " + daemon_id + " not found for discovery session " + session_id});
    return;
  }

  auto target = **daemon.value;
  fleet_->dispatch_discovery(target, request, [table = table_, fleet = fleet_, target, session_id, callback](Status status) {
    if (status.failed()) {
      mark_failed(*table, session_id, status.error->message);
      callback(Result<DiscoverySession>::failure(*status.error));
      return;
    }

    auto advanced = table->advance(session_id, SessionUpdate::to(SessionState::Dispatched));
    if (advanced.ok() && advanced.value->state == SessionState::Cancelled) {
      // Cancelled while the request was in flight; the daemon has started anyway
      spdlog::info("Discovery session {} was cancelled during dispatch, cancelling on daemon {}", session_id, target.id);
      fleet->dispatch_cancellation(target, session_id, [session_id](Status cancelled) {
        if (cancelled.failed()) {
          spdlog::warn("Late cancellation of discovery session {} failed: {}", session_id, cancelled.error->message);
        }
      });
    }
    callback(std::move(advanced));
  });
}

std::future<Result<DiscoverySession>> DiscoveryManager::start_discovery(const DaemonId &daemon_id, DiscoveryRequest request) {
  return to_future([this, &daemon_id, &request](SessionCallback callback) {
    start_discovery(daemon_id, std::move(request), std::move(callback));
  });
}

void DiscoveryManager::cancel(const SessionId &session_id, SessionCallback callback) {
  auto session = table_->get(session_id);
  if (!session) {
    callback(Result<DiscoverySession>::failure(ErrorKind::NotFound, "Discovery session " + session_id + " not found"));
    return;
  }

  if (session->terminal()) {
    spdlog::debug("Discovery session {} already {}, nothing to cancel", session_id, to_string(session->state));
    callback(Result<DiscoverySession>::success(std::move(*session)));
    return;
  }

  auto cancel_locally = [table = table_, session_id, callback]() {
    callback(table->advance(session_id, SessionUpdate::to(SessionState::Cancelled)));
  };

  // Not yet acknowledged by the daemon: a dispatch that lands later sends its own cancellation
  if (session->state == SessionState::Pending) {
    cancel_locally();
    return;
  }

  auto daemon = fleet_->get_daemon(session->daemon_id);
  if (daemon.failed() || !daemon.value->has_value()) {
    spdlog::warn("Daemon {} of discovery session {} is unavailable ({}), cancelling locally", session->daemon_id, session_id,
                 daemon.failed() ? daemon.error->message : "not registered");
    cancel_locally();
    return;
  }

  fleet_->dispatch_cancellation(**daemon.value, session_id, [session_id, cancel_locally](Status status) {
    if (status.failed()) {
      spdlog::warn("Daemon did not confirm cancellation of discovery session {}: {}", session_id, status.error->message);
    }
    cancel_locally();
  });
}

std::future<Result<DiscoverySession>> DiscoveryManager::cancel(const SessionId &session_id) {
  return to_future([this, &session_id](SessionCallback callback) {
    cancel(session_id, std::move(callback));
  });
}

Result<DiscoverySession> DiscoveryManager::advance(const SessionId &session_id, const SessionUpdate &update) {
  return table_->advance(session_id, update);
}

std::optional<DiscoverySession> DiscoveryManager::get(const SessionId &session_id) const {
  return table_->get(session_id);
}

std::vector<DiscoverySession> DiscoveryManager::list_active() const {
  return table_->list_active();
}

}  // namespace netvisor
