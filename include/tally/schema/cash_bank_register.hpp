#pragma once
#include <tally/schema/cash_bank_kind.hpp>
#include <tally/schema/primitives.hpp>
#include <string>

// Schema type: cash/bank register.
// Operational entity with its own fast-access balance. The balance is a
// mirror of the linked ledger account and is never incremented directly.
namespace tally::schema {

template <uint16_t Version>
struct cash_bank_register;

template <>
struct cash_bank_register<1> final {
  uint16_t version{1};
  register_id_t id{};
  std::string code;
  std::string name;
  cash_bank_kind_t kind{cash_bank_kind_t::cash};
  account_id_t account_id{};
  amount_t balance{};
  /// (last_entry_id, line_count) of the projection reflected in `balance`;
  /// an older projection never overwrites a newer one.
  entry_id_t last_entry_id{};
  uint64_t line_count{};
  /// Closed registers keep their code and history but are no longer
  /// mirrored.
  bool active{true};
  timestamp_milliseconds_t refreshed_at{};
};

using cash_bank_register_t = cash_bank_register<1>;

}  // namespace tally::schema
