#pragma once
#include <tally/schema/idempotency_key.hpp>
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// RocksDB keyspace. Every prefix ends in '|' and no prefix is a prefix of
// another, so list_by_prefix never crosses tables.
namespace tally::schema::key {

inline constexpr auto kAccountPrefix = std::string_view{"ACCT|"};
inline constexpr auto kAccountCodePrefix = std::string_view{"ACCTCODE|"};
inline constexpr auto kEntryPrefix = std::string_view{"ENTRY|"};
inline constexpr auto kEntryLinesPrefix = std::string_view{"ELINES|"};
inline constexpr auto kIdempotencyPrefix = std::string_view{"IDEM|"};
inline constexpr auto kPostedLinePrefix = std::string_view{"PLINE|"};
inline constexpr auto kDraftLinePrefix = std::string_view{"DLINE|"};
inline constexpr auto kBalancePrefix = std::string_view{"BAL|"};
inline constexpr auto kCashBankPrefix = std::string_view{"CASHBANK|"};
inline constexpr auto kCashBankAccountPrefix =
    std::string_view{"CASHBANKACCT|"};
inline constexpr auto kCashBankCodePrefix = std::string_view{"CASHBANKCODE|"};
inline constexpr auto kWarningPrefix = std::string_view{"WARN|"};
inline constexpr auto kWarningOpenPrefix = std::string_view{"WARNOPEN|"};

inline constexpr auto kAccountSequenceKey = std::string_view{"SYS|SEQ|ACCT"};
inline constexpr auto kEntrySequenceKey = std::string_view{"SYS|SEQ|ENTRY"};
inline constexpr auto kRegisterSequenceKey =
    std::string_view{"SYS|SEQ|CASHBANK"};
inline constexpr auto kWarningSequenceKey = std::string_view{"SYS|SEQ|WARN"};

bytes_t make_prefix(std::string_view prefix);

bytes_t make_account_key(account_id_t id);
bytes_t make_account_code_key(std::string_view code);

bytes_t make_entry_key(entry_id_t id);
bytes_t make_entry_lines_key(entry_id_t id);
bytes_t make_idempotency_key(const idempotency_key_t& key);

/// Posted line index, ordered by (posted_at, entry id, line number) within an
/// account.
bytes_t make_posted_line_key(account_id_t account_id,
                             timestamp_milliseconds_t posted_at,
                             entry_id_t entry_id,
                             uint32_t line_number);
bytes_t make_posted_line_prefix(account_id_t account_id);

bytes_t make_draft_line_key(account_id_t account_id,
                            entry_id_t entry_id,
                            uint32_t line_number);
bytes_t make_draft_line_prefix(account_id_t account_id);

bytes_t make_balance_key(account_id_t account_id);

bytes_t make_cash_bank_key(register_id_t id);
bytes_t make_cash_bank_account_key(account_id_t account_id);
bytes_t make_cash_bank_code_key(std::string_view code);

bytes_t make_warning_key(warning_id_t id);

/// Pending-warning index, one row per open condition. Holds the id of the
/// warning currently tracking (type, account, entry).
bytes_t make_warning_open_key(uint8_t type,
                              const std::optional<account_id_t>& account_id,
                              const std::optional<entry_id_t>& entry_id);

}  // namespace tally::schema::key
