#include "daemon/daemon_store.hpp"

#include <algorithm>

namespace netvisor {

namespace store_detail {

Status check_unique(const DaemonMap &records, const Daemon &daemon, bool include_id) {
  if (include_id && records.count(daemon.id) > 0) {
    return Status::failure(ErrorKind::Conflict, "Daemon " + daemon.id + " already exists");
  }

  for (const auto &[id, existing] : records) {
    if (id == daemon.id) continue;
    if (existing.host_id == daemon.host_id) {
      return Status::failure(ErrorKind::Conflict, "Host " + daemon.host_id + " already has daemon " + id);
    }
    if (existing.api_key == daemon.api_key) {
      return Status::failure(ErrorKind::Conflict, "Api key of daemon " + daemon.id + " is already in use");
    }
  }
  return Status::success();
}

std::optional<Daemon> find_by_host_id(const DaemonMap &records, const HostId &host_id) {
  for (const auto &[id, daemon] : records) {
    if (daemon.host_id == host_id) {
      return daemon;
    }
  }
  return std::nullopt;
}

std::optional<Daemon> find_by_api_key(const DaemonMap &records, const std::string &api_key) {
  for (const auto &[id, daemon] : records) {
    if (daemon.api_key == api_key) {
      return daemon;
    }
  }
  return std::nullopt;
}

std::vector<Daemon> select_networks(const DaemonMap &records, const std::set<NetworkId> &network_ids) {
  std::vector<Daemon> result;
  for (const auto &[id, daemon] : records) {
    if (network_ids.count(daemon.network_id) > 0) {
      result.push_back(daemon);
    }
  }

  // Fleets are displayed newest first; id keeps ties deterministic
  std::sort(result.begin(), result.end(), [](const Daemon &a, const Daemon &b) {
    if (a.registered_at != b.registered_at) return a.registered_at > b.registered_at;
    return a.id < b.id;
  });
  return result;
}

}  // namespace store_detail

// --- InMemoryDaemonStore ---

Status InMemoryDaemonStore::create(const Daemon &daemon) {
  std::lock_guard lock(mutex_);

  auto status = store_detail::check_unique(records_, daemon, true);
  if (status.failed()) {
    return status;
  }

  records_[daemon.id] = daemon;
  return Status::success();
}

Result<std::optional<Daemon>> InMemoryDaemonStore::get_by_id(const DaemonId &id) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) {
    return Result<std::optional<Daemon>>::success(std::nullopt);
  }
  return Result<std::optional<Daemon>>::success(it->second);
}

Result<std::optional<Daemon>> InMemoryDaemonStore::get_by_host_id(const HostId &host_id) {
  std::lock_guard lock(mutex_);
  return Result<std::optional<Daemon>>::success(store_detail::find_by_host_id(records_, host_id));
}

Result<std::optional<Daemon>> InMemoryDaemonStore::get_by_api_key_hash(const std::string &api_key_hash) {
  std::lock_guard lock(mutex_);
  return Result<std::optional<Daemon>>::success(store_detail::find_by_api_key(records_, api_key_hash));
}

Result<std::vector<Daemon>> InMemoryDaemonStore::get_all(const std::set<NetworkId> &network_ids) {
  std::lock_guard lock(mutex_);
  return Result<std::vector<Daemon>>::success(store_detail::select_networks(records_, network_ids));
}

Result<Daemon> InMemoryDaemonStore::update(const Daemon &daemon) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(daemon.id);
  if (it == records_.end()) {
    return Result<Daemon>::failure(ErrorKind::NotFound, "Daemon " + daemon.id + " not found");
  }

  auto status = store_detail::check_unique(records_, daemon, false);
  if (status.failed()) {
    return Result<Daemon>::failure(*status.error);
  }

  Daemon updated = daemon;
  updated.registered_at = it->second.registered_at;
  updated.last_seen = it->second.last_seen;
  it->second = updated;
  return Result<Daemon>::success(updated);
}

Result<Daemon> InMemoryDaemonStore::touch(const DaemonId &id, Timestamp seen) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) {
    return Result<Daemon>::failure(ErrorKind::NotFound, "Daemon " + id + " not found");
  }

  it->second.last_seen = std::max(it->second.last_seen, seen);
  return Result<Daemon>::success(it->second);
}

Status InMemoryDaemonStore::remove(const DaemonId &id) {
  std::lock_guard lock(mutex_);
  records_.erase(id);
  return Status::success();
}

}  // namespace netvisor
