#include <spdlog/spdlog.h>
#include <tally/reconciliation/reconciliation_service.hpp>
#include <exception>

namespace tally::reconciliation {

reconciliation_service::reconciliation_service(
    reconciler& target,
    const std::chrono::milliseconds interval)
    : reconciler_{target}, interval_{interval} {}

reconciliation_service::~reconciliation_service() {
  stop();
}

void reconciliation_service::start() {
  if (worker_.joinable()) {
    return;
  }
  stop_requested_ = false;
  worker_ = std::thread{[this] { run(); }};
  spdlog::info("Reconciliation service started, interval {} ms",
               interval_.count());
}

void reconciliation_service::stop() {
  if (!worker_.joinable()) {
    return;
  }
  {
    auto lock = std::lock_guard{mutex_};
    stop_requested_ = true;
  }
  wake_.notify_all();
  worker_.join();
  spdlog::info("Reconciliation service stopped after {} passes",
               passes_.load());
}

bool reconciliation_service::running() const {
  return worker_.joinable() && !stop_requested_.load();
}

uint64_t reconciliation_service::passes() const {
  return passes_.load();
}

std::optional<reconciliation_report> reconciliation_service::last_report()
    const {
  auto lock = std::lock_guard{mutex_};
  return last_report_;
}

void reconciliation_service::run() {
  while (!stop_requested_.load()) {
    try {
      auto report = reconciler_.reconcile(stop_requested_);
      auto lock = std::lock_guard{mutex_};
      last_report_ = std::move(report);
    } catch (const std::exception& e) {
      spdlog::error("Reconciliation pass failed: {}", e.what());
    }
    ++passes_;

    auto lock = std::unique_lock{mutex_};
    wake_.wait_for(lock, interval_, [this] { return stop_requested_.load(); });
  }
}

}  // namespace tally::reconciliation
