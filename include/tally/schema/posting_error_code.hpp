#pragma once

#include <cstdint>
#include <string_view>

// Schema type: posting error code.
// Stable numeric codes for rejected ledger writes. Zero means success.
namespace tally::schema {

enum class posting_error_code : uint32_t {
  ok = 0,
  invalid_proposal = 1,
  account_missing = 2,
  account_inactive = 3,
  header_account = 4,
  invalid_amount = 5,
  invalid_line = 6,
  invalid_date = 7,
  period_closed = 8,
  unbalanced_entry = 10,
  entry_missing = 20,
  entry_not_voidable = 21,
  entry_not_draft = 22,
  storage_failure = 30,
  account_conflict = 40,
  parent_missing = 41,
  parent_not_header = 42,
  class_mismatch = 43,
  register_missing = 50,
};

inline constexpr std::string_view to_string(const posting_error_code code) {
  switch (code) {
    case posting_error_code::ok:
      return "ok";
    case posting_error_code::invalid_proposal:
      return "invalid_proposal";
    case posting_error_code::account_missing:
      return "account_missing";
    case posting_error_code::account_inactive:
      return "account_inactive";
    case posting_error_code::header_account:
      return "header_account";
    case posting_error_code::invalid_amount:
      return "invalid_amount";
    case posting_error_code::invalid_line:
      return "invalid_line";
    case posting_error_code::invalid_date:
      return "invalid_date";
    case posting_error_code::period_closed:
      return "period_closed";
    case posting_error_code::unbalanced_entry:
      return "unbalanced_entry";
    case posting_error_code::entry_missing:
      return "entry_missing";
    case posting_error_code::entry_not_voidable:
      return "entry_not_voidable";
    case posting_error_code::entry_not_draft:
      return "entry_not_draft";
    case posting_error_code::storage_failure:
      return "storage_failure";
    case posting_error_code::account_conflict:
      return "account_conflict";
    case posting_error_code::parent_missing:
      return "parent_missing";
    case posting_error_code::parent_not_header:
      return "parent_not_header";
    case posting_error_code::class_mismatch:
      return "class_mismatch";
    case posting_error_code::register_missing:
      return "register_missing";
  }
  return "unknown";
}

/// Validation-class codes: the proposal is malformed and nothing was written.
inline constexpr bool is_validation_error(const posting_error_code code) {
  const auto value = static_cast<uint32_t>(code);
  return value >= 1 && value < 10;
}

}  // namespace tally::schema
