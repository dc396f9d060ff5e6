#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

/// An external entity's cached copy of one leaf account's balance, as read
/// from or written to that entity.
struct mirror_balance_t final {
  std::string target;
  uint64_t record_id{};
  account_id_t account_id{};
  amount_t balance{};
  timestamp_milliseconds_t refreshed_at{};
};

}  // namespace tally::schema
