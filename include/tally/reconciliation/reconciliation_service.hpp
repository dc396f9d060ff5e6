#pragma once
#include <tally/reconciliation/reconciler.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace tally::reconciliation {

/// Runs `reconciler::reconcile()` on a background thread every `interval`.
class reconciliation_service final {
 public:
  reconciliation_service(reconciler& target, std::chrono::milliseconds interval);
  ~reconciliation_service();

  reconciliation_service(const reconciliation_service&) = delete;
  reconciliation_service& operator=(const reconciliation_service&) = delete;

  /// Start the worker; the first pass runs immediately. No-op when running.
  void start();

  /// Ask the running pass to stop at the next account boundary and join.
  void stop();

  bool running() const;
  uint64_t passes() const;
  std::optional<reconciliation_report> last_report() const;

 private:
  void run();

  reconciler& reconciler_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> passes_{0};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::optional<reconciliation_report> last_report_;
};

}  // namespace tally::reconciliation
