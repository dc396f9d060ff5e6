#pragma once
#include <tally/schema/account_balance.hpp>
#include <tally/schema/mirror_balance.hpp>
#include <tally/schema/primitives.hpp>
#include <string_view>
#include <vector>

namespace tally::mirror {

/// An operational entity type that keeps its own copy of ledger balances.
/// Implementations only ever overwrite their copy with a projected balance.
class mirror_target {
 public:
  virtual ~mirror_target() = default;

  virtual std::string_view kind() const = 0;

  /// Every leaf account at least one record of this target mirrors.
  virtual std::vector<tally::schema::account_id_t> mirrored_accounts()
      const = 0;

  virtual bool mirrors(tally::schema::account_id_t account_id) const = 0;

  /// Overwrite every record linked to account_id with `balance`.
  virtual std::vector<tally::schema::mirror_balance_t> refresh(
      tally::schema::account_id_t account_id,
      const tally::schema::account_balance_t& balance) = 0;

  virtual std::vector<tally::schema::mirror_balance_t> read(
      tally::schema::account_id_t account_id) const = 0;
};

}  // namespace tally::mirror
