#include "discovery/session_table.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netvisor {

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Pending:
      return "pending";
    case SessionState::Dispatched:
      return "dispatched";
    case SessionState::Running:
      return "running";
    case SessionState::Completed:
      return "completed";
    case SessionState::Failed:
      return "failed";
    case SessionState::Cancelled:
      return "cancelled";
    case SessionState::TimedOut:
      return "timed_out";
  }
  return "unknown";
}

std::optional<SessionState> session_state_from_string(const std::string &str) {
  if (str == "pending") return SessionState::Pending;
  if (str == "dispatched") return SessionState::Dispatched;
  if (str == "running") return SessionState::Running;
  if (str == "completed") return SessionState::Completed;
  if (str == "failed") return SessionState::Failed;
  if (str == "cancelled") return SessionState::Cancelled;
  if (str == "timed_out") return SessionState::TimedOut;
  return std::nullopt;
}

bool is_terminal(SessionState state) {
  switch (state) {
    case SessionState::Completed:
    case SessionState::Failed:
    case SessionState::Cancelled:
    case SessionState::TimedOut:
      return true;
    default:
      return false;
  }
}

bool can_transition(SessionState from, SessionState to) {
  if (is_terminal(from)) return false;

  switch (to) {
    case SessionState::Pending:
      return false;
    case SessionState::Dispatched:
      return from == SessionState::Pending;
    case SessionState::Running:
    case SessionState::Completed:
      // A daemon report may overtake the dispatch acknowledgment
      return true;
    case SessionState::Failed:
    case SessionState::Cancelled:
    case SessionState::TimedOut:
      return true;
  }
  return false;
}

json DiscoverySession::to_json() const {
  json j;
  j["session_id"] = session_id;
  j["daemon_id"] = daemon_id;
  j["state"] = to_string(state);
  j["created_at"] = to_epoch_ms(created_at);
  j["updated_at"] = to_epoch_ms(updated_at);
  j["progress"] = progress;
  if (error) {
    j["error"] = *error;
  } else {
    j["error"] = nullptr;
  }
  return j;
}

// --- DiscoverySessionTable ---

DiscoverySessionTable::DiscoverySessionTable(Clock clock) : clock_(std::move(clock)) {}

Result<DiscoverySession> DiscoverySessionTable::create(const SessionId &session_id, const DaemonId &daemon_id) {
  DiscoverySession session;
  session.session_id = session_id;
  session.daemon_id = daemon_id;
  session.created_at = clock_();
  session.updated_at = session.created_at;

  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = sessions_.emplace(session_id, session);
    if (!inserted) {
      return Result<DiscoverySession>::failure(ErrorKind::Conflict, "Discovery session " + session_id + " already exists");
    }
  }

  spdlog::debug("Discovery session {} created for daemon {}", session_id, daemon_id);
  return Result<DiscoverySession>::success(std::move(session));
}

std::optional<DiscoverySession> DiscoverySessionTable::get(const SessionId &session_id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<DiscoverySession> DiscoverySessionTable::advance(const SessionId &session_id, const SessionUpdate &update) {
  auto now = clock_();
  SessionState from = SessionState::Pending;
  bool legal = false;
  DiscoverySession snapshot;

  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return Result<DiscoverySession>::failure(ErrorKind::NotFound, "Discovery session " + session_id + " not found");
    }

    auto &session = it->second;
    from = session.state;

    // TimedOut belongs to the reclaimer
    legal = update.state != SessionState::TimedOut && can_transition(from, update.state);
    if (legal) {
      session.state = update.state;
      session.updated_at = std::max(session.updated_at, now);
      if (!update.progress.is_null()) {
        session.progress = update.progress;
      }
      if (update.error) {
        session.error = update.error;
      }
    }
    snapshot = session;
  }

  if (!legal) {
    spdlog::debug("Ignoring {} -> {} for discovery session {}", to_string(from), to_string(update.state), session_id);
  } else if (from != update.state) {
    spdlog::info("Discovery session {} {} -> {}", session_id, to_string(from), to_string(update.state));
  }
  return Result<DiscoverySession>::success(std::move(snapshot));
}

std::vector<DiscoverySession> DiscoverySessionTable::list_active() const {
  std::vector<DiscoverySession> result;
  {
    std::lock_guard lock(mutex_);
    for (const auto &[id, session] : sessions_) {
      if (!session.terminal()) {
        result.push_back(session);
      }
    }
  }

  std::sort(result.begin(), result.end(), [](const DiscoverySession &a, const DiscoverySession &b) {
    return a.created_at < b.created_at;
  });
  return result;
}

std::vector<DiscoverySession> DiscoverySessionTable::list_all() const {
  std::vector<DiscoverySession> result;
  {
    std::lock_guard lock(mutex_);
    result.reserve(sessions_.size());
    for (const auto &[id, session] : sessions_) {
      result.push_back(session);
    }
  }

  std::sort(result.begin(), result.end(), [](const DiscoverySession &a, const DiscoverySession &b) {
    return a.created_at < b.created_at;
  });
  return result;
}

bool DiscoverySessionTable::remove(const SessionId &session_id) {
  std::lock_guard lock(mutex_);
  return sessions_.erase(session_id) > 0;
}

size_t DiscoverySessionTable::size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

size_t DiscoverySessionTable::expire_overdue(std::chrono::seconds ceiling) {
  auto now = clock_();
  std::vector<SessionId> expired;

  {
    std::lock_guard lock(mutex_);
    for (auto &[id, session] : sessions_) {
      if (session.terminal() || now - session.created_at <= ceiling) continue;
      session.state = SessionState::TimedOut;
      session.updated_at = std::max(session.updated_at, now);
      expired.push_back(id);
    }
  }

  for (const auto &id : expired) {
    spdlog::warn("Discovery session {} timed out after {}s", id, ceiling.count());
  }
  return expired.size();
}

size_t DiscoverySessionTable::evict_terminal(std::chrono::seconds retention) {
  auto now = clock_();
  size_t evicted = 0;

  std::lock_guard lock(mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.terminal() && now - it->second.updated_at > retention) {
      it = sessions_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

}  // namespace netvisor
