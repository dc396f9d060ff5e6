#pragma once
#include <tally/mirror/mirror_target.hpp>
#include <tally/projection/balance_projector.hpp>
#include <tally/schema/consistency_warning.hpp>
#include <atomic>
#include <cstddef>
#include <vector>

namespace tally::mirror {

struct sweep_report final {
  std::size_t accounts_checked{};
  std::size_t refreshed{};
  bool interrupted{};
  /// `mirror_mismatch` for every repaired divergence, `mirror_write_failed`
  /// for every refresh that threw.
  std::vector<tally::schema::consistency_warning_t> warnings;
};

/// Keeps registered mirror targets equal to projected balances. Reads
/// balances from the projector only; never writes them.
class mirror_adapter final {
 public:
  explicit mirror_adapter(const tally::projection::balance_projector& projector);

  /// Targets are not owned and must outlive the adapter.
  void add_target(mirror_target& target);

  /// Push the projected balance of account_id to every target mirroring it.
  /// Write failures propagate.
  std::vector<tally::schema::mirror_balance_t> refresh(
      tally::schema::account_id_t account_id);

  /// True when every mirror of account_id equals the projected balance.
  bool validate(tally::schema::account_id_t account_id) const;

  /// Validate every mirrored account and refresh the divergent ones. Stops
  /// between accounts once `stop` is set.
  sweep_report sweep(const std::atomic<bool>& stop);

 private:
  tally::schema::account_balance_t projected(
      tally::schema::account_id_t account_id) const;

  const tally::projection::balance_projector& projector_;
  std::vector<mirror_target*> targets_;
};

}  // namespace tally::mirror
