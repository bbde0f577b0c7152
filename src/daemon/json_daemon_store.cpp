#include "daemon/json_daemon_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netvisor {

namespace fs = std::filesystem;

JsonDaemonStore::JsonDaemonStore(const fs::path &base_dir) : base_dir_(base_dir), file_(base_dir / "daemons.json") {}

Result<std::shared_ptr<JsonDaemonStore>> JsonDaemonStore::open(const fs::path &base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir, ec);
  if (ec) {
    return Result<std::shared_ptr<JsonDaemonStore>>::failure(ErrorKind::StorageFailure,
                                                             "Failed to create data directory " + base_dir.string() + ": " + ec.message());
  }

  auto store = std::shared_ptr<JsonDaemonStore>(new JsonDaemonStore(base_dir));
  auto status = store->load();
  if (status.failed()) {
    return Result<std::shared_ptr<JsonDaemonStore>>::failure(*status.error);
  }

  spdlog::info("Daemon store opened at {} ({} records)", store->file_.string(), store->records_.size());
  return Result<std::shared_ptr<JsonDaemonStore>>::success(std::move(store));
}

// --- Persistence ---

Status JsonDaemonStore::load() {
  if (!fs::exists(file_)) {
    return Status::success();
  }

  std::ifstream file(file_);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::StorageFailure, "Failed to open " + file_.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::exception &e) {
    return Status::failure(ErrorKind::SerializationFailure, "Failed to parse " + file_.string() + ": " + e.what());
  }

  if (!j.is_array()) {
    return Status::failure(ErrorKind::SerializationFailure, file_.string() + " does not hold a daemon array");
  }

  store_detail::DaemonMap records;
  for (const auto &record : j) {
    auto daemon = Daemon::from_json(record);
    if (!daemon.ok()) {
      return Status::failure(*daemon.error);
    }
    records[daemon.value->id] = std::move(*daemon.value);
  }

  records_ = std::move(records);
  return Status::success();
}

Status JsonDaemonStore::persist(const store_detail::DaemonMap &records) {
  json j = json::array();
  for (const auto &[id, daemon] : records) {
    j.push_back(daemon.to_json());
  }
  return atomic_write(file_, j.dump(2));
}

Status JsonDaemonStore::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::StorageFailure, "Failed to open temp file for writing: " + tmp_path.string());
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorKind::StorageFailure, "Failed to write temp file: " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    auto message = "Failed to rename temp file " + tmp_path.string() + " -> " + path.string() + ": " + ec.message();
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorKind::StorageFailure, message);
  }

  return Status::success();
}

// --- DaemonStore interface ---

Status JsonDaemonStore::create(const Daemon &daemon) {
  std::lock_guard lock(mutex_);

  auto status = store_detail::check_unique(records_, daemon, true);
  if (status.failed()) {
    return status;
  }

  auto records = records_;
  records[daemon.id] = daemon;

  status = persist(records);
  if (status.failed()) {
    spdlog::warn("Failed to persist daemon {}: {}", daemon.id, status.error->message);
    return status;
  }

  records_ = std::move(records);
  return Status::success();
}

Result<std::optional<Daemon>> JsonDaemonStore::get_by_id(const DaemonId &id) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) {
    return Result<std::optional<Daemon>>::success(std::nullopt);
  }
  return Result<std::optional<Daemon>>::success(it->second);
}

Result<std::optional<Daemon>> JsonDaemonStore::get_by_host_id(const HostId &host_id) {
  std::lock_guard lock(mutex_);
  return Result<std::optional<Daemon>>::success(store_detail::find_by_host_id(records_, host_id));
}

Result<std::optional<Daemon>> JsonDaemonStore::get_by_api_key_hash(const std::string &api_key_hash) {
  std::lock_guard lock(mutex_);
  return Result<std::optional<Daemon>>::success(store_detail::find_by_api_key(records_, api_key_hash));
}

Result<std::vector<Daemon>> JsonDaemonStore::get_all(const std::set<NetworkId> &network_ids) {
  std::lock_guard lock(mutex_);
  return Result<std::vector<Daemon>>::success(store_detail::select_networks(records_, network_ids));
}

Result<Daemon> JsonDaemonStore::update(const Daemon &daemon) {
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

  auto records = records_;
  records[daemon.id] = updated;

  status = persist(records);
  if (status.failed()) {
    spdlog::warn("Failed to persist update of daemon {}: {}", daemon.id, status.error->message);
    return Result<Daemon>::failure(*status.error);
  }

  records_ = std::move(records);
  return Result<Daemon>::success(updated);
}

Result<Daemon> JsonDaemonStore::touch(const DaemonId &id, Timestamp seen) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) {
    return Result<Daemon>::failure(ErrorKind::NotFound, "Daemon " + id + " not found");
  }
  if (seen <= it->second.last_seen) {
    return Result<Daemon>::success(it->second);
  }

  auto records = records_;
  records[id].last_seen = seen;

  auto status = persist(records);
  if (status.failed()) {
    spdlog::warn("Failed to persist heartbeat of daemon {}: {}", id, status.error->message);
    return Result<Daemon>::failure(*status.error);
  }

  records_ = std::move(records);
  return Result<Daemon>::success(records_[id]);
}

Status JsonDaemonStore::remove(const DaemonId &id) {
  std::lock_guard lock(mutex_);

  if (records_.count(id) == 0) {
    return Status::success();
  }

  auto records = records_;
  records.erase(id);

  auto status = persist(records);
  if (status.failed()) {
    spdlog::warn("Failed to persist removal of daemon {}: {}", id, status.error->message);
    return status;
  }

  records_ = std::move(records);
  return Status::success();
}

}  // namespace netvisor
