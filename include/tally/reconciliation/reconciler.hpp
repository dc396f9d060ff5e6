#pragma once
#include <tally/directory/account_directory.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/projection/balance_projector.hpp>
#include <tally/reconciliation/warning_log.hpp>
#include <tally/schema/consistency_warning.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <vector>

namespace tally::reconciliation {

struct reconciler_options final {
  bool sweep_mirrors{true};
  bool validate_hierarchy{true};
  /// Resolved warnings older than this are deleted at the end of a pass.
  std::chrono::milliseconds resolved_retention{std::chrono::hours{24 * 30}};
};

struct reconciliation_report final {
  /// Another reconcile() was already running; nothing was done.
  bool skipped{};
  /// Stopped early at an account boundary.
  bool interrupted{};
  std::size_t accounts_rebuilt{};
  std::size_t mirrors_refreshed{};
  tally::ledger::trial_balance_t trial_balance;
  bool equation_holds{true};
  /// Divergences found and repaired by this pass.
  std::vector<tally::schema::consistency_warning_t> repaired;
  /// Findings that still hold after this pass.
  std::vector<tally::schema::consistency_warning_t> outstanding;
  /// Previously queued warnings marked resolved by this pass.
  std::size_t resolved{};
  /// Resolved warnings deleted past the retention window.
  std::size_t pruned{};
  tally::schema::timestamp_milliseconds_t started_at{};
  tally::schema::timestamp_milliseconds_t finished_at{};
};

/// Rebuilds every derived balance from the journal and checks the ledger's
/// global invariants. Safe to run at any time and any number of times.
class reconciler final {
 public:
  reconciler(const tally::directory::account_directory& directory,
             const tally::ledger::ledger_store& ledger,
             tally::projection::balance_projector& projector,
             tally::mirror::mirror_adapter& mirrors,
             warning_log& warnings,
             reconciler_options options = {});

  reconciliation_report reconcile();
  reconciliation_report reconcile(const std::atomic<bool>& stop);

 private:
  const tally::directory::account_directory& directory_;
  const tally::ledger::ledger_store& ledger_;
  tally::projection::balance_projector& projector_;
  tally::mirror::mirror_adapter& mirrors_;
  warning_log& warnings_;
  reconciler_options options_;
  std::mutex running_;
};

}  // namespace tally::reconciliation
