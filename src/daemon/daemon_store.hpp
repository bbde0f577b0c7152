#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "daemon/daemon.hpp"

namespace netvisor {

// Daemon record storage interface.
// Lookups return std::nullopt for a legitimate miss; errors are reserved for engine failures.
class DaemonStore {
 public:
  virtual ~DaemonStore() = default;

  // Conflict if id, host_id or api_key is already taken
  virtual Status create(const Daemon &daemon) = 0;
  virtual Result<std::optional<Daemon>> get_by_id(const DaemonId &id) = 0;
  virtual Result<std::optional<Daemon>> get_by_host_id(const HostId &host_id) = 0;
  virtual Result<std::optional<Daemon>> get_by_api_key_hash(const std::string &api_key_hash) = 0;
  // Newest registered_at first
  virtual Result<std::vector<Daemon>> get_all(const std::set<NetworkId> &network_ids) = 0;
  // Full replace by id, registered_at and last_seen preserved. NotFound if absent
  virtual Result<Daemon> update(const Daemon &daemon) = 0;
  // Sets last_seen = max(stored, seen) and returns the stored record. NotFound if absent
  virtual Result<Daemon> touch(const DaemonId &id, Timestamp seen) = 0;
  // Idempotent
  virtual Status remove(const DaemonId &id) = 0;
};

namespace store_detail {

using DaemonMap = std::map<DaemonId, Daemon>;

// Checks the unique columns of `daemon` against every record except the one with its own id
Status check_unique(const DaemonMap &records, const Daemon &daemon, bool include_id);

std::optional<Daemon> find_by_host_id(const DaemonMap &records, const HostId &host_id);

std::optional<Daemon> find_by_api_key(const DaemonMap &records, const std::string &api_key);

std::vector<Daemon> select_networks(const DaemonMap &records, const std::set<NetworkId> &network_ids);

}  // namespace store_detail

// In-memory daemon store
class InMemoryDaemonStore : public DaemonStore {
 public:
  Status create(const Daemon &daemon) override;
  Result<std::optional<Daemon>> get_by_id(const DaemonId &id) override;
  Result<std::optional<Daemon>> get_by_host_id(const HostId &host_id) override;
  Result<std::optional<Daemon>> get_by_api_key_hash(const std::string &api_key_hash) override;
  Result<std::vector<Daemon>> get_all(const std::set<NetworkId> &network_ids) override;
  Result<Daemon> update(const Daemon &daemon) override;
  Result<Daemon> touch(const DaemonId &id, Timestamp seen) override;
  Status remove(const DaemonId &id) override;

 private:
  std::mutex mutex_;
  store_detail::DaemonMap records_;
};

}  // namespace netvisor
