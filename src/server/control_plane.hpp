#pragma once

#include <asio.hpp>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "daemon/daemon_store.hpp"
#include "discovery/discovery_manager.hpp"
#include "discovery/reclaimer.hpp"
#include "discovery/session_table.hpp"
#include "fleet/fleet_service.hpp"
#include "net/http_client.hpp"

namespace netvisor {

// Picks the daemon store named by config.storage ("json" under data_dir, or "memory")
Result<std::shared_ptr<DaemonStore>> open_daemon_store(const ServerConfig &config);

// Owns the io_context, its worker threads and every long-lived component.
// The reclaimer is started exactly once, by start().
class ControlPlane {
 public:
  static Result<std::unique_ptr<ControlPlane>> create(const ServerConfig &config);

  ~ControlPlane();

  ControlPlane(const ControlPlane &) = delete;
  ControlPlane &operator=(const ControlPlane &) = delete;

  void start();

  // Stops the reclaimer, lets in-flight work drain, joins the workers
  void stop();

  bool running() const {
    return running_;
  }

  asio::io_context &io_context() {
    return io_ctx_;
  }

  const ServerConfig &config() const {
    return config_;
  }

  std::shared_ptr<FleetService> fleet() const {
    return fleet_;
  }

  std::shared_ptr<DiscoveryManager> discovery() const {
    return discovery_;
  }

  std::shared_ptr<DiscoverySessionTable> sessions() const {
    return sessions_;
  }

  Reclaimer &reclaimer() {
    return *reclaimer_;
  }

 private:
  ControlPlane(const ServerConfig &config, std::shared_ptr<DaemonStore> store);

  ServerConfig config_;
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> workers_;
  bool running_ = false;

  std::shared_ptr<DaemonStore> store_;
  std::shared_ptr<net::HttpClient> http_;
  std::shared_ptr<FleetService> fleet_;
  std::shared_ptr<DiscoverySessionTable> sessions_;
  std::shared_ptr<DiscoveryManager> discovery_;
  std::unique_ptr<Reclaimer> reclaimer_;
};

}  // namespace netvisor
