#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"

namespace netvisor {

// Discovery session state
enum class SessionState { Pending, Dispatched, Running, Completed, Failed, Cancelled, TimedOut };

std::string to_string(SessionState state);

std::optional<SessionState> session_state_from_string(const std::string &str);

bool is_terminal(SessionState state);

// Whether `from -> to` is a legal step. Terminal states have no outgoing steps.
bool can_transition(SessionState from, SessionState to);

struct DiscoverySession {
  SessionId session_id;
  DaemonId daemon_id;
  SessionState state = SessionState::Pending;
  Timestamp created_at{};
  Timestamp updated_at{};
  json progress;  // Last payload reported by the daemon, opaque here
  std::optional<std::string> error;

  bool terminal() const {
    return is_terminal(state);
  }

  json to_json() const;
};

// A status change reported for a session
struct SessionUpdate {
  SessionState state = SessionState::Running;
  json progress;                     // Replaces the stored payload when not null
  std::optional<std::string> error;  // Recorded on Failed

  static SessionUpdate to(SessionState state) {
    return SessionUpdate{state, nullptr, std::nullopt};
  }

  static SessionUpdate failed(std::string error) {
    return SessionUpdate{SessionState::Failed, nullptr, std::move(error)};
  }
};

// Registry of in-flight and recently finished discovery sessions.
// Not persisted. The mutex is held only for the map access itself.
class DiscoverySessionTable {
 public:
  explicit DiscoverySessionTable(Clock clock = system_clock());

  // Conflict if the id is already tracked
  Result<DiscoverySession> create(const SessionId &session_id, const DaemonId &daemon_id);

  std::optional<DiscoverySession> get(const SessionId &session_id) const;

  // Applies the update if the transition is legal and returns the session as it now is.
  // Updates on terminal sessions and illegal steps are no-ops. NotFound for unknown ids.
  Result<DiscoverySession> advance(const SessionId &session_id, const SessionUpdate &update);

  // Non-terminal sessions
  std::vector<DiscoverySession> list_active() const;

  std::vector<DiscoverySession> list_all() const;

  bool remove(const SessionId &session_id);

  size_t size() const;

  // Moves non-terminal sessions older than `ceiling` (by created_at) to TimedOut
  size_t expire_overdue(std::chrono::seconds ceiling);

  // Drops terminal sessions whose last update is older than `retention`.
  // Measured from updated_at, not created_at: a session that ran for hours
  // is still kept `retention` after it finished.
  size_t evict_terminal(std::chrono::seconds retention);

  Timestamp now() const {
    return clock_();
  }

 private:
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<SessionId, DiscoverySession> sessions_;
};

}  // namespace netvisor
