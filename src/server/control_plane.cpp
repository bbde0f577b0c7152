#include "server/control_plane.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "daemon/json_daemon_store.hpp"

namespace netvisor {

Result<std::shared_ptr<DaemonStore>> open_daemon_store(const ServerConfig &config) {
  if (config.storage == "memory") {
    spdlog::warn("Using in-memory daemon store; registrations are lost on restart");
    return Result<std::shared_ptr<DaemonStore>>::success(std::make_shared<InMemoryDaemonStore>());
  }

  if (config.storage != "json") {
    return Result<std::shared_ptr<DaemonStore>>::failure(ErrorKind::StorageFailure, "Unknown storage backend '" + config.storage + "'");
  }

  auto store = JsonDaemonStore::open(config.data_dir);
  if (store.failed()) {
    return Result<std::shared_ptr<DaemonStore>>::failure(*store.error);
  }
  spdlog::info("Daemon store: {}", (*store.value)->file().string());
  return Result<std::shared_ptr<DaemonStore>>::success(*store.value);
}

Result<std::unique_ptr<ControlPlane>> ControlPlane::create(const ServerConfig &config) {
  auto valid = config.validate();
  if (valid.failed()) {
    return Result<std::unique_ptr<ControlPlane>>::failure(*valid.error);
  }

  auto store = open_daemon_store(config);
  if (store.failed()) {
    return Result<std::unique_ptr<ControlPlane>>::failure(*store.error);
  }
  return Result<std::unique_ptr<ControlPlane>>::success(std::unique_ptr<ControlPlane>(new ControlPlane(config, *store.value)));
}

ControlPlane::ControlPlane(const ServerConfig &config, std::shared_ptr<DaemonStore> store)
    : config_(config), store_(std::move(store)) {
  http_ = std::make_shared<net::HttpClient>(io_ctx_);
  fleet_ = std::make_shared<FleetService>(store_, http_, config_.fleet_options());
  sessions_ = std::make_shared<DiscoverySessionTable>();
  discovery_ = std::make_shared<DiscoveryManager>(sessions_, fleet_);
  reclaimer_ = std::make_unique<Reclaimer>(io_ctx_, sessions_, config_.reclaim_settings());
}

ControlPlane::~ControlPlane() {
  stop();
}

void ControlPlane::start() {
  if (running_) return;
  running_ = true;

  work_.emplace(asio::make_work_guard(io_ctx_));
  auto threads = std::max<size_t>(1, config_.worker_threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this]() {
      io_ctx_.run();
    });
  }

  reclaimer_->start();
  spdlog::info("Control plane running with {} worker threads", threads);
}

void ControlPlane::stop() {
  if (!running_) return;
  running_ = false;

  reclaimer_->stop();
  work_.reset();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  io_ctx_.restart();
  spdlog::info("Control plane stopped");
}

}  // namespace netvisor
