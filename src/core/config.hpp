#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "discovery/reclaimer.hpp"
#include "fleet/fleet_service.hpp"
#include "types.hpp"

namespace netvisor {

// Control plane server configuration
struct ServerConfig {
  struct ServerSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 60072;
  } server;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Where the json storage backend keeps its files
  std::filesystem::path data_dir;

  // "json" or "memory"
  std::string storage = "json";

  size_t worker_threads = 4;

  struct DiscoverySettings {
    int64_t reclaim_interval_secs = 300;
    int64_t session_timeout_secs = 600;
    int64_t session_retention_secs = 86400;
    bool timeout_sweep_enabled = true;
    int64_t dispatch_timeout_secs = 30;
  } discovery;

  struct SecuritySettings {
    bool hash_api_keys = false;
  } security;

  ServerConfig();

  // Missing file gives the defaults. A malformed file or an out-of-range value is an error.
  static Result<ServerConfig> load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Result<ServerConfig> load_default();

  // Config file (load_default) overlaid with NETVISOR_HOST, NETVISOR_PORT,
  // NETVISOR_LOG_LEVEL and NETVISOR_DATA_DIR
  static Result<ServerConfig> from_env();

  // Apply environment variables on top of an already loaded config
  void apply_env();

  // Durations must be positive; worker_threads in [1, 256]
  Status validate() const;

  Status save(const std::filesystem::path& path) const;

  json to_json() const;

  FleetOptions fleet_options() const;

  ReclaimSettings reclaim_settings() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_data_dir();
}  // namespace config_paths

}  // namespace netvisor
