#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct journal_line;

/// One debit-or-credit movement. Exactly one side is non-zero.
template <>
struct journal_line<1> final {
  uint16_t version{1};
  entry_id_t entry_id{};
  uint32_t line_number{};
  account_id_t account_id{};
  amount_t debit{};
  amount_t credit{};
  std::string description;
};

using journal_line_t = journal_line<1>;

}  // namespace tally::schema
