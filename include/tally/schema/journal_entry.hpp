#pragma once
#include <tally/schema/entry_status.hpp>
#include <tally/schema/idempotency_key.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: journal entry.
// Ledger record: one balanced business transaction. Posted entries are never
// edited; a void writes a reversing entry and flips the original's status.
namespace tally::schema {

template <uint16_t Version>
struct journal_entry;

template <>
struct journal_entry<1> final {
  uint16_t version{1};
  entry_id_t id{};
  std::string entry_number;
  calendar_date_t entry_date{};
  std::string description;
  std::string source_type;
  source_id_t source_id{};
  std::string purpose;
  entry_status_t status{entry_status_t::draft};
  amount_t total_debit{};
  amount_t total_credit{};
  timestamp_milliseconds_t posted_at{};
  hash32_t content_hash{};
  std::optional<entry_id_t> reversal_of;
  std::optional<entry_id_t> reversed_by;
  std::string void_reason;

  idempotency_key_t idempotency_key() const {
    return idempotency_key_t{
        .source_type = source_type, .source_id = source_id, .purpose = purpose};
  }
};

using journal_entry_t = journal_entry<1>;

}  // namespace tally::schema
