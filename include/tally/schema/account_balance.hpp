#pragma once
#include <tally/schema/primitives.hpp>

// Schema type: account balance.
// Projection cache: always recomputable from posted journal lines. `balance`
// follows the normal-balance convention of the account's class.
namespace tally::schema {

template <uint16_t Version>
struct account_balance;

template <>
struct account_balance<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  amount_t balance{};
  amount_t total_debit{};
  amount_t total_credit{};
  uint64_t line_count{};
  entry_id_t last_entry_id{};
  timestamp_milliseconds_t projected_at{};
};

using account_balance_t = account_balance<1>;

}  // namespace tally::schema
