#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <utility>

namespace netvisor {

namespace fs = std::filesystem;

namespace {

bool valid_storage(const std::string& storage) {
  return storage == "json" || storage == "memory";
}

constexpr int64_t kMaxWorkerThreads = 256;

Status require_positive(const char* name, int64_t value) {
  if (value <= 0) {
    return Status::failure(ErrorKind::SerializationFailure, std::string("Invalid ") + name + " " + std::to_string(value) + ": must be positive");
  }
  return Status::success();
}

}  // namespace

ServerConfig::ServerConfig() : data_dir(config_paths::default_data_dir()) {}

Result<ServerConfig> ServerConfig::load(const fs::path& path) {
  ServerConfig config;

  if (!fs::exists(path)) {
    return Result<ServerConfig>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<ServerConfig>::failure(ErrorKind::StorageFailure, "Cannot open config file " + path.string());
  }

  try {
    json j = json::parse(file);

    if (j.contains("server")) {
      const auto& server = j["server"];
      config.server.host = server.value("host", config.server.host);
      auto port = server.value("port", static_cast<int64_t>(config.server.port));
      if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        return Result<ServerConfig>::failure(ErrorKind::SerializationFailure, "Invalid server.port " + std::to_string(port));
      }
      config.server.port = static_cast<uint16_t>(port);
    }

    config.log_level = j.value("log_level", config.log_level);
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
    if (j.contains("data_dir")) {
      config.data_dir = j["data_dir"].get<std::string>();
    }

    config.storage = j.value("storage", config.storage);
    if (!valid_storage(config.storage)) {
      return Result<ServerConfig>::failure(ErrorKind::SerializationFailure, "Unknown storage backend '" + config.storage + "'");
    }

    auto workers = j.value("worker_threads", static_cast<int64_t>(config.worker_threads));
    if (workers < 0 || workers > kMaxWorkerThreads) {
      return Result<ServerConfig>::failure(ErrorKind::SerializationFailure, "Invalid worker_threads " + std::to_string(workers));
    }
    config.worker_threads = workers == 0 ? 1 : static_cast<size_t>(workers);

    // Load discovery settings
    if (j.contains("discovery")) {
      const auto& d = j["discovery"];
      config.discovery.reclaim_interval_secs = d.value("reclaim_interval_secs", config.discovery.reclaim_interval_secs);
      config.discovery.session_timeout_secs = d.value("session_timeout_secs", config.discovery.session_timeout_secs);
      config.discovery.session_retention_secs = d.value("session_retention_secs", config.discovery.session_retention_secs);
      config.discovery.timeout_sweep_enabled = d.value("timeout_sweep_enabled", config.discovery.timeout_sweep_enabled);
      config.discovery.dispatch_timeout_secs = d.value("dispatch_timeout_secs", config.discovery.dispatch_timeout_secs);
    }

    if (j.contains("security")) {
      config.security.hash_api_keys = j["security"].value("hash_api_keys", config.security.hash_api_keys);
    }

  } catch (const json::exception& e) {
    return Result<ServerConfig>::failure(ErrorKind::SerializationFailure, "Invalid config file " + path.string() + ": " + e.what());
  }

  auto status = config.validate();
  if (status.failed()) {
    return Result<ServerConfig>::failure(ErrorKind::SerializationFailure, path.string() + ": " + status.error->message);
  }

  return Result<ServerConfig>::success(std::move(config));
}

Status ServerConfig::validate() const {
  if (!valid_storage(storage)) {
    return Status::failure(ErrorKind::SerializationFailure, "Unknown storage backend '" + storage + "'");
  }
  if (worker_threads == 0 || worker_threads > static_cast<size_t>(kMaxWorkerThreads)) {
    return Status::failure(ErrorKind::SerializationFailure, "Invalid worker_threads " + std::to_string(worker_threads));
  }

  const std::pair<const char*, int64_t> durations[] = {
      {"discovery.reclaim_interval_secs", discovery.reclaim_interval_secs},
      {"discovery.session_timeout_secs", discovery.session_timeout_secs},
      {"discovery.session_retention_secs", discovery.session_retention_secs},
      {"discovery.dispatch_timeout_secs", discovery.dispatch_timeout_secs},
  };
  for (const auto& [name, value] : durations) {
    auto status = require_positive(name, value);
    if (status.failed()) {
      return status;
    }
  }
  return Status::success();
}

Result<ServerConfig> ServerConfig::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Result<ServerConfig>::success(ServerConfig{});
}

Result<ServerConfig> ServerConfig::from_env() {
  auto config = load_default();
  if (config.ok()) {
    config.value->apply_env();
  }
  return config;
}

void ServerConfig::apply_env() {
  if (const char* host = std::getenv("NETVISOR_HOST")) {
    server.host = host;
  }

  if (const char* port = std::getenv("NETVISOR_PORT")) {
    try {
      auto value = std::stoul(port);
      if (value == 0 || value > std::numeric_limits<uint16_t>::max()) {
        spdlog::warn("Ignoring NETVISOR_PORT={}: out of range", port);
      } else {
        server.port = static_cast<uint16_t>(value);
      }
    } catch (const std::exception& e) {
      spdlog::warn("Ignoring NETVISOR_PORT={}: {}", port, e.what());
    }
  }

  if (const char* level = std::getenv("NETVISOR_LOG_LEVEL")) {
    log_level = level;
  }

  if (const char* dir = std::getenv("NETVISOR_DATA_DIR")) {
    data_dir = dir;
  }
}

json ServerConfig::to_json() const {
  json j;
  j["server"] = {{"host", server.host}, {"port", server.port}};
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  j["data_dir"] = data_dir.string();
  j["storage"] = storage;
  j["worker_threads"] = worker_threads;
  j["discovery"] = {{"reclaim_interval_secs", discovery.reclaim_interval_secs},
                    {"session_timeout_secs", discovery.session_timeout_secs},
                    {"session_retention_secs", discovery.session_retention_secs},
                    {"timeout_sweep_enabled", discovery.timeout_sweep_enabled},
                    {"dispatch_timeout_secs", discovery.dispatch_timeout_secs}};
  j["security"] = {{"hash_api_keys", security.hash_api_keys}};
  return j;
}

Status ServerConfig::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::failure(ErrorKind::StorageFailure, "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::StorageFailure, "Cannot write config file " + path.string());
  }
  file << to_json().dump(2);
  if (!file) {
    return Status::failure(ErrorKind::StorageFailure, "Failed writing config file " + path.string());
  }
  return Status::success();
}

FleetOptions ServerConfig::fleet_options() const {
  FleetOptions options;
  options.dispatch_timeout = std::chrono::seconds(discovery.dispatch_timeout_secs);
  options.hash_api_keys = security.hash_api_keys;
  return options;
}

ReclaimSettings ServerConfig::reclaim_settings() const {
  ReclaimSettings settings;
  settings.interval = std::chrono::seconds(discovery.reclaim_interval_secs);
  settings.session_timeout = std::chrono::seconds(discovery.session_timeout_secs);
  settings.session_retention = std::chrono::seconds(discovery.session_retention_secs);
  settings.timeout_sweep_enabled = discovery.timeout_sweep_enabled;
  return settings;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "netvisor";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".netvisor" / "config.json";
}

fs::path default_data_dir() {
  return config_dir() / "data";
}

}  // namespace config_paths

}  // namespace netvisor
