#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include "daemon/daemon_store.hpp"

namespace netvisor {

// JSON file-based daemon store
// Storage layout:
//   base_dir/
//     daemons.json    array of daemon records
// Records are cached in memory; every mutation rewrites the file atomically
// and only becomes visible once the write succeeded.
class JsonDaemonStore : public DaemonStore {
 public:
  // Loads an existing daemons.json. Fails if the file is unreadable or corrupt.
  static Result<std::shared_ptr<JsonDaemonStore>> open(const std::filesystem::path &base_dir);

  Status create(const Daemon &daemon) override;
  Result<std::optional<Daemon>> get_by_id(const DaemonId &id) override;
  Result<std::optional<Daemon>> get_by_host_id(const HostId &host_id) override;
  Result<std::optional<Daemon>> get_by_api_key_hash(const std::string &api_key_hash) override;
  Result<std::vector<Daemon>> get_all(const std::set<NetworkId> &network_ids) override;
  Result<Daemon> update(const Daemon &daemon) override;
  Result<Daemon> touch(const DaemonId &id, Timestamp seen) override;
  Status remove(const DaemonId &id) override;

  const std::filesystem::path &file() const {
    return file_;
  }

 private:
  explicit JsonDaemonStore(const std::filesystem::path &base_dir);

  Status load();
  Status persist(const store_detail::DaemonMap &records);

  // Atomic write: write to .tmp then rename
  Status atomic_write(const std::filesystem::path &path, const std::string &content);

  std::filesystem::path base_dir_;
  std::filesystem::path file_;
  std::mutex mutex_;
  store_detail::DaemonMap records_;
};

}  // namespace netvisor
