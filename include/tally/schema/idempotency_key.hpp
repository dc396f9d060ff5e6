#pragma once
#include <tally/schema/primitives.hpp>
#include <compare>
#include <string>

namespace tally::schema {

/// (source type, source id, purpose): one financial effect of one business
/// event, e.g. ("SALE", 42, "INVOICE") and ("SALE", 42, "PAYMENT").
struct idempotency_key_t final {
  std::string source_type;
  source_id_t source_id{};
  std::string purpose;

  auto operator<=>(const idempotency_key_t&) const = default;
};

}  // namespace tally::schema
