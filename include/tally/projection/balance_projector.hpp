#pragma once
#include <tally/directory/account_directory.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/account_balance.hpp>
#include <tally/schema/consistency_warning.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tally::projection {

using storage_t = tally::storage::rocksdb_storage_t;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

/// Raised when a balance cannot be derived, e.g. an unknown account or a sum
/// outside the amount range.
struct projection_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct rebuild_report final {
  std::size_t accounts_rebuilt{};
  /// One `balance_drift` warning per cached balance that differed from the
  /// rebuilt one (or was missing while the rebuilt one is non-zero).
  std::vector<tally::schema::consistency_warning_t> drifts;
  std::map<tally::schema::account_id_t, tally::schema::account_balance_t>
      balances;
};

/// Sole writer of the `BAL|` keyspace. Every balance is a recomputation from
/// posted lines (leaves) or from child balances (headers); nothing is ever
/// adjusted incrementally.
class balance_projector final {
 public:
  balance_projector(storage_t& storage,
                    const tally::directory::account_directory& directory,
                    const tally::ledger::ledger_store& ledger);

  tally::schema::account_balance_t project_account(
      tally::schema::account_id_t account_id);

  /// Re-project every ancestor, parent first, root last.
  std::vector<tally::schema::account_balance_t> project_ancestors(
      tally::schema::account_id_t account_id);

  /// Re-project the given accounts, then the union of their ancestors from
  /// the deepest level up, as one batch that verify_rollups never observes
  /// half done.
  std::vector<tally::schema::account_balance_t> project_touched(
      const std::vector<tally::schema::account_id_t>& account_ids);

  std::optional<tally::schema::account_balance_t> balance(
      tally::schema::account_id_t account_id) const;

  /// Rebuild every balance from the line history and replace the cache in one
  /// write batch.
  rebuild_report rematerialize();

  /// Headers whose cached balance differs from the live sum of their
  /// children's cached balances. Reported, never corrected here. Runs
  /// between projection batches.
  std::vector<tally::schema::consistency_warning_t> verify_rollups() const;

 private:
  tally::schema::account_balance_t compute_leaf(
      const tally::schema::account_t& account) const;
  using child_balance_t = std::pair<tally::schema::account_t,
                                    tally::schema::account_balance_t>;

  tally::schema::account_balance_t compute_header(
      const tally::schema::account_t& header,
      const std::vector<child_balance_t>& children) const;
  tally::schema::account_balance_t compute_locked(
      const tally::schema::account_t& account) const;
  tally::schema::account_balance_t store_locked(
      const tally::schema::account_balance_t& balance);
  tally::schema::account_balance_t project_locked(
      const tally::schema::account_t& account);
  tally::schema::account_t require_account(
      tally::schema::account_id_t account_id) const;

  storage_t& storage_;
  const tally::directory::account_directory& directory_;
  const tally::ledger::ledger_store& ledger_;
  mutable std::mutex mutex_;
};

/// Balance as shown on a report: credit-normal classes are shown positive.
/// Only ever applied to a finished balance, never before aggregation.
tally::schema::amount_t display_balance(
    const tally::schema::account_t& account,
    const tally::schema::account_balance_t& balance);

/// `child.balance` expressed in the sign convention of `parent`.
std::optional<tally::schema::amount_t> to_parent_sign(
    const tally::schema::account_t& parent,
    const tally::schema::account_t& child,
    tally::schema::amount_t balance);

}  // namespace tally::projection
