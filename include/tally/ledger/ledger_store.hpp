#pragma once
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/idempotency_key.hpp>
#include <tally/schema/journal_entry.hpp>
#include <tally/schema/journal_line.hpp>
#include <tally/schema/posting_result.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::ledger {

using storage_t = tally::storage::rocksdb_storage_t;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCodespace = std::string_view{"tally.ledger"};
inline constexpr auto kReversalSourceType = std::string_view{"REVERSAL"};
inline constexpr auto kReversalPurpose = std::string_view{"VOID"};

/// Lazy, restartable walk over one account's lines: posted lines ordered by
/// (posted_at, entry id, line number), then draft lines by entry id when
/// drafts are included.
class line_cursor final {
 public:
  line_cursor(const storage_t& storage,
              tally::schema::account_id_t account_id,
              bool posted_only);

  std::optional<tally::schema::journal_line_t> next();

  /// Start over from the first line against a fresh snapshot.
  void reset();

 private:
  const storage_t* storage_;
  tally::schema::account_id_t account_id_;
  bool posted_only_;
  bool in_drafts_{false};
  std::optional<tally::storage::rocksdb_cursor_t> cursor_;
};

struct trial_balance_t final {
  tally::schema::amount_t total_debit{};
  tally::schema::amount_t total_credit{};
  uint64_t line_count{};

  bool balanced() const { return total_debit == total_credit; }
};

/// Durable journal. Every write is one RocksDB transaction, so an entry, its
/// lines, the per-account line index and the idempotency row land together
/// or not at all. Storage failures surface as `storage::storage_error`.
class ledger_store final {
 public:
  explicit ledger_store(storage_t& storage);

  /// Post a balanced entry. `entry` supplies date, description, source and
  /// content hash; the store assigns id, number, status and posted_at. When
  /// the idempotency key is already held by a posted entry, that entry is
  /// returned with `replayed` set and nothing is written.
  tally::schema::posting_result_t append(
      const tally::schema::journal_entry_t& entry,
      const std::vector<tally::schema::journal_line_t>& lines);

  std::optional<tally::schema::journal_entry_t> find_by_idempotency_key(
      const tally::schema::idempotency_key_t& key) const;

  line_cursor lines_for_account(tally::schema::account_id_t account_id,
                                bool posted_only = true) const;

  /// Reverse a posted entry with a swapped-sides entry dated `date` (the
  /// original's date when 0) and mark the original void.
  tally::schema::posting_result_t void_entry(
      tally::schema::entry_id_t entry_id,
      std::string_view reason,
      tally::schema::calendar_date_t date);

  /// Store an entry as DRAFT. Drafts hold no idempotency row and are
  /// invisible to balances.
  tally::schema::posting_result_t save_draft(
      const tally::schema::journal_entry_t& entry,
      const std::vector<tally::schema::journal_line_t>& lines);

  tally::schema::posting_result_t promote_draft(
      tally::schema::entry_id_t entry_id);

  std::optional<tally::schema::journal_entry_t> find(
      tally::schema::entry_id_t entry_id) const;
  std::vector<tally::schema::journal_line_t> lines(
      tally::schema::entry_id_t entry_id) const;

  /// Every entry, drafts and void entries included, ordered by id.
  std::vector<tally::schema::journal_entry_t> entries() const;

  /// Debit and credit totals over every posted line.
  trial_balance_t trial_balance() const;

 private:
  storage_t& storage_;
};

/// BLAKE3 over (account, debit, credit, description) of every line in order.
tally::schema::hash32_t content_fingerprint(
    const std::vector<tally::schema::journal_line_t>& lines);

/// JE-YYYYMM-NNNNNN.
std::string make_entry_number(tally::schema::calendar_date_t date,
                              tally::schema::entry_id_t id);

}  // namespace tally::ledger
