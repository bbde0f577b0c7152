#include "discovery/reclaimer.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace netvisor {

Reclaimer::State::State(asio::io_context &io_ctx, std::shared_ptr<DiscoverySessionTable> t, ReclaimSettings s)
    : table(std::move(t)), settings(s), strand(asio::make_strand(io_ctx)), timer(strand) {}

Reclaimer::Reclaimer(asio::io_context &io_ctx, std::shared_ptr<DiscoverySessionTable> table, ReclaimSettings settings)
    : state_(std::make_shared<State>(io_ctx, std::move(table), settings)) {}

Reclaimer::~Reclaimer() {
  stop();
}

void Reclaimer::start() {
  if (state_->running.exchange(true)) {
    return;
  }

  const auto &settings = state_->settings;
  spdlog::info("Session reclaimer started: interval {}s, timeout {}s ({}), retention {}s", settings.interval.count(),
               settings.session_timeout.count(), settings.timeout_sweep_enabled ? "enabled" : "disabled", settings.session_retention.count());
  std::weak_ptr<State> weak = state_;
  asio::post(state_->strand, [weak] {
    if (auto state = weak.lock()) {
      schedule(state);
    }
  });
}

void Reclaimer::stop() {
  if (!state_->running.exchange(false)) {
    return;
  }

  // The timer is only touched on the strand
  auto cancelled = std::make_shared<std::promise<void>>();
  auto done = cancelled->get_future();
  std::weak_ptr<State> weak = state_;
  asio::post(state_->strand, [weak, cancelled] {
    if (auto state = weak.lock()) {
      state->timer.cancel();
    }
    cancelled->set_value();
  });

  // With no thread running the io_context the cancel stays queued. A tick that
  // fires first sees running == false; destroying the state cancels the wait.
  if (done.wait_for(std::chrono::seconds(1)) != std::future_status::ready) {
    spdlog::debug("Session reclaimer stopped without a running io_context");
  }
  spdlog::info("Session reclaimer stopped");
}

void Reclaimer::schedule(const std::shared_ptr<State> &state) {
  if (!state->running) return;

  std::weak_ptr<State> weak = state;
  state->timer.expires_after(state->settings.interval);
  state->timer.async_wait([weak](const asio::error_code &ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    auto locked = weak.lock();
    if (!locked || !locked->running) {
      return;
    }
    sweep(*locked);
    schedule(locked);
  });
}

SweepReport Reclaimer::sweep() {
  return sweep(*state_);
}

SweepReport Reclaimer::sweep(State &state) {
  SweepReport report;
  auto &table = *state.table;

  if (state.settings.timeout_sweep_enabled) {
    report.timed_out = table.expire_overdue(state.settings.session_timeout);
  }
  report.evicted = table.evict_terminal(state.settings.session_retention);

  if (report.timed_out > 0 || report.evicted > 0) {
    spdlog::info("Reclaimed discovery sessions: {} timed out, {} evicted, {} remaining", report.timed_out, report.evicted, table.size());
  } else {
    spdlog::debug("Reclaim sweep found nothing to do ({} sessions)", table.size());
  }
  return report;
}

}  // namespace netvisor
