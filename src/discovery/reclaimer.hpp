#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>

#include "discovery/session_table.hpp"

namespace netvisor {

struct ReclaimSettings {
  std::chrono::seconds interval{300};
  std::chrono::seconds session_timeout{600};      // Running-time ceiling
  std::chrono::seconds session_retention{86400};  // Terminal sessions kept this long
  bool timeout_sweep_enabled = true;
};

struct SweepReport {
  size_t timed_out = 0;
  size_t evicted = 0;
};

// Periodic sweep of the session table on an io_context timer.
// Only touches the in-memory table; never storage, never the network.
// Queued handlers hold the timer state weakly, so the io_context may keep
// running after the Reclaimer is gone.
class Reclaimer {
 public:
  Reclaimer(asio::io_context &io_ctx, std::shared_ptr<DiscoverySessionTable> table, ReclaimSettings settings);

  ~Reclaimer();

  Reclaimer(const Reclaimer &) = delete;
  Reclaimer &operator=(const Reclaimer &) = delete;

  // First tick fires one interval after start
  void start();

  // Cancels the pending tick. Safe to call more than once.
  void stop();

  bool running() const {
    return state_->running.load();
  }

  // One tick, run synchronously
  SweepReport sweep();

  const ReclaimSettings &settings() const {
    return state_->settings;
  }

 private:
  struct State {
    State(asio::io_context &io_ctx, std::shared_ptr<DiscoverySessionTable> t, ReclaimSettings s);

    std::shared_ptr<DiscoverySessionTable> table;
    ReclaimSettings settings;
    asio::strand<asio::io_context::executor_type> strand;
    asio::steady_timer timer;
    std::atomic<bool> running{false};
  };

  static void schedule(const std::shared_ptr<State> &state);
  static SweepReport sweep(State &state);

  std::shared_ptr<State> state_;
};

}  // namespace netvisor
