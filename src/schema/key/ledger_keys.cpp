#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/ledger_keys.hpp>

namespace tally::schema::key {

bytes_t make_prefix(const std::string_view prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_account_key(const account_id_t id) {
  return builder{}.write(kAccountPrefix).write(id).data;
}

bytes_t make_account_code_key(const std::string_view code) {
  return builder{}.write(kAccountCodePrefix).write(code).data;
}

bytes_t make_entry_key(const entry_id_t id) {
  return builder{}.write(kEntryPrefix).write(id).data;
}

bytes_t make_entry_lines_key(const entry_id_t id) {
  return builder{}.write(kEntryLinesPrefix).write(id).data;
}

bytes_t make_idempotency_key(const idempotency_key_t& key) {
  return builder{}
      .write(kIdempotencyPrefix)
      .write_sized(key.source_type)
      .write(key.source_id)
      .write_sized(key.purpose)
      .data;
}

bytes_t make_posted_line_key(const account_id_t account_id,
                             const timestamp_milliseconds_t posted_at,
                             const entry_id_t entry_id,
                             const uint32_t line_number) {
  return builder{}
      .write(kPostedLinePrefix)
      .write(account_id)
      .write(posted_at)
      .write(entry_id)
      .write(line_number)
      .data;
}

bytes_t make_posted_line_prefix(const account_id_t account_id) {
  return builder{}.write(kPostedLinePrefix).write(account_id).data;
}

bytes_t make_draft_line_key(const account_id_t account_id,
                            const entry_id_t entry_id,
                            const uint32_t line_number) {
  return builder{}
      .write(kDraftLinePrefix)
      .write(account_id)
      .write(entry_id)
      .write(line_number)
      .data;
}

bytes_t make_draft_line_prefix(const account_id_t account_id) {
  return builder{}.write(kDraftLinePrefix).write(account_id).data;
}

bytes_t make_balance_key(const account_id_t account_id) {
  return builder{}.write(kBalancePrefix).write(account_id).data;
}

bytes_t make_cash_bank_key(const register_id_t id) {
  return builder{}.write(kCashBankPrefix).write(id).data;
}

bytes_t make_cash_bank_account_key(const account_id_t account_id) {
  return builder{}.write(kCashBankAccountPrefix).write(account_id).data;
}

bytes_t make_cash_bank_code_key(const std::string_view code) {
  return builder{}.write(kCashBankCodePrefix).write(code).data;
}

bytes_t make_warning_key(const warning_id_t id) {
  return builder{}.write(kWarningPrefix).write(id).data;
}

bytes_t make_warning_open_key(const uint8_t type,
                              const std::optional<account_id_t>& account_id,
                              const std::optional<entry_id_t>& entry_id) {
  auto key = builder{};
  key.write(kWarningOpenPrefix).write(type);
  key.write(static_cast<uint8_t>(account_id.has_value()))
      .write(account_id.value_or(0));
  key.write(static_cast<uint8_t>(entry_id.has_value()))
      .write(entry_id.value_or(0));
  return key.data;
}

}  // namespace tally::schema::key
