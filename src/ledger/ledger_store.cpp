#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/blake3/hash.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/schema/amount.hpp>
#include <tally/schema/calendar_date.hpp>
#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/ledger_keys.hpp>

namespace tally::ledger {

namespace {

using tally::schema::amount_t;
using tally::schema::bytes_t;
using tally::schema::entry_id_t;
using tally::schema::entry_status_t;
using tally::schema::journal_entry_t;
using tally::schema::journal_line_t;
using tally::schema::make_bytes_view;
using tally::schema::posting_error_code;
using tally::schema::posting_result_t;
using tally::storage::rocksdb_transaction_t;
using tally::storage::storage_error;

using line_record_t =
    tally::schema::encoding::record_traits<journal_line_t>::type;

posting_result_t make_ledger_error(const posting_error_code code,
                                   std::string log,
                                   std::string info = {}) {
  return tally::schema::make_error(code, std::move(log), std::move(info),
                                   std::string{kCodespace});
}

posting_result_t make_entry_result(journal_entry_t entry,
                                   std::vector<journal_line_t> lines,
                                   const bool replayed) {
  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  result.replayed = replayed;
  result.entry = std::move(entry);
  result.lines = std::move(lines);
  return result;
}

struct totals_t final {
  amount_t debit{};
  amount_t credit{};
};

/// Ledger-level preconditions. The posting engine checks the same rules
/// first; these keep the store from accepting a malformed write directly.
std::optional<posting_result_t> check_lines(
    const std::vector<journal_line_t>& lines,
    totals_t& totals) {
  if (lines.size() < 2) {
    return make_ledger_error(posting_error_code::invalid_proposal,
                             "an entry needs at least two lines");
  }
  for (const auto& line : lines) {
    if (line.debit < 0 || line.credit < 0) {
      return make_ledger_error(posting_error_code::invalid_amount,
                               "line amounts must not be negative");
    }
    if ((line.debit == 0) == (line.credit == 0)) {
      return make_ledger_error(posting_error_code::invalid_line,
                               "exactly one of debit or credit must be set");
    }
    auto debit = tally::schema::checked_add(totals.debit, line.debit);
    auto credit = tally::schema::checked_add(totals.credit, line.credit);
    if (!debit || !credit) {
      return make_ledger_error(posting_error_code::invalid_amount,
                               "entry total overflows");
    }
    totals.debit = *debit;
    totals.credit = *credit;
  }
  if (totals.debit != totals.credit) {
    return make_ledger_error(
        posting_error_code::unbalanced_entry, "debits must equal credits",
        fmt::format("debit {} credit {}",
                    tally::schema::format_amount(totals.debit),
                    tally::schema::format_amount(totals.credit)));
  }
  return std::nullopt;
}

std::vector<journal_line_t> number_lines(
    const std::vector<journal_line_t>& lines,
    const entry_id_t entry_id) {
  auto out = lines;
  auto number = uint32_t{1};
  for (auto& line : out) {
    line.entry_id = entry_id;
    line.line_number = number++;
  }
  return out;
}

bytes_t encode_lines(encoder_t& encoder,
                     const std::vector<journal_line_t>& lines) {
  auto records = std::vector<line_record_t>{};
  records.reserve(lines.size());
  for (const auto& line : lines) {
    records.push_back(
        tally::schema::encoding::record_traits<journal_line_t>::to_record(
            line));
  }
  return encoder.encode(records);
}

std::vector<journal_line_t> decode_lines(encoder_t& encoder,
                                         const bytes_t& raw) {
  auto records =
      encoder.try_decode<std::vector<line_record_t>>(make_bytes_view(raw));
  if (!records) {
    throw storage_error{"corrupt journal lines"};
  }
  auto lines = std::vector<journal_line_t>{};
  lines.reserve(records->size());
  for (const auto& record : *records) {
    auto line =
        tally::schema::encoding::record_traits<journal_line_t>::from_record(
            record);
    if (!line) {
      throw storage_error{"corrupt journal line"};
    }
    lines.push_back(std::move(*line));
  }
  return lines;
}

std::optional<journal_entry_t> decode_entry(encoder_t& encoder,
                                            const std::optional<bytes_t>& raw) {
  if (!raw) {
    return std::nullopt;
  }
  auto entry =
      encoder.try_decode_record<journal_entry_t>(make_bytes_view(*raw));
  if (!entry) {
    throw storage_error{"corrupt journal entry"};
  }
  return entry;
}

entry_id_t decode_entry_id(encoder_t& encoder, const bytes_t& raw) {
  auto id = encoder.try_decode<entry_id_t>(make_bytes_view(raw));
  if (!id) {
    throw storage_error{"corrupt idempotency row"};
  }
  return *id;
}

void put_entry(rocksdb_transaction_t& txn,
               encoder_t& encoder,
               const journal_entry_t& entry) {
  auto key = tally::schema::key::make_entry_key(entry.id);
  auto value = encoder.encode_record(entry);
  txn.put(make_bytes_view(key), make_bytes_view(value));
}

void put_lines(rocksdb_transaction_t& txn,
               encoder_t& encoder,
               const entry_id_t entry_id,
               const std::vector<journal_line_t>& lines) {
  auto key = tally::schema::key::make_entry_lines_key(entry_id);
  auto value = encode_lines(encoder, lines);
  txn.put(make_bytes_view(key), make_bytes_view(value));
}

void put_posted_index(rocksdb_transaction_t& txn,
                      encoder_t& encoder,
                      const journal_entry_t& entry,
                      const std::vector<journal_line_t>& lines) {
  for (const auto& line : lines) {
    auto key = tally::schema::key::make_posted_line_key(
        line.account_id, entry.posted_at, entry.id, line.line_number);
    auto value = encoder.encode_record(line);
    txn.put(make_bytes_view(key), make_bytes_view(value));
  }
}

void put_idempotency_row(rocksdb_transaction_t& txn,
                         encoder_t& encoder,
                         const journal_entry_t& entry) {
  auto key = tally::schema::key::make_idempotency_key(entry.idempotency_key());
  auto value = encoder.encode(entry.id);
  txn.put(make_bytes_view(key), make_bytes_view(value));
}

journal_entry_t read_entry(rocksdb_transaction_t& txn,
                           encoder_t& encoder,
                           const entry_id_t entry_id) {
  auto key = tally::schema::key::make_entry_key(entry_id);
  auto entry = decode_entry(encoder, txn.get(make_bytes_view(key)));
  if (!entry) {
    throw storage_error{fmt::format("entry {} is referenced but missing",
                                    entry_id)};
  }
  return *entry;
}

std::vector<journal_line_t> read_lines(rocksdb_transaction_t& txn,
                                       encoder_t& encoder,
                                       const entry_id_t entry_id) {
  auto key = tally::schema::key::make_entry_lines_key(entry_id);
  auto raw = txn.get(make_bytes_view(key));
  if (!raw) {
    throw storage_error{fmt::format("lines of entry {} are missing", entry_id)};
  }
  return decode_lines(encoder, *raw);
}

posting_result_t replay(rocksdb_transaction_t& txn,
                        encoder_t& encoder,
                        const bytes_t& idempotency_row) {
  auto existing_id = decode_entry_id(encoder, idempotency_row);
  auto existing = read_entry(txn, encoder, existing_id);
  auto lines = read_lines(txn, encoder, existing_id);
  spdlog::info("Idempotent replay of {} for ({}, {}, {})",
               existing.entry_number, existing.source_type, existing.source_id,
               existing.purpose);
  return make_entry_result(std::move(existing), std::move(lines), true);
}

}  // namespace

line_cursor::line_cursor(const storage_t& storage,
                         const tally::schema::account_id_t account_id,
                         const bool posted_only)
    : storage_{&storage}, account_id_{account_id}, posted_only_{posted_only} {
  reset();
}

void line_cursor::reset() {
  in_drafts_ = false;
  auto prefix = tally::schema::key::make_posted_line_prefix(account_id_);
  cursor_.emplace(storage_->scan(make_bytes_view(prefix)));
}

std::optional<journal_line_t> line_cursor::next() {
  auto encoder = encoder_t{};
  auto row = cursor_->next();
  if (!row && !posted_only_ && !in_drafts_) {
    in_drafts_ = true;
    auto prefix = tally::schema::key::make_draft_line_prefix(account_id_);
    cursor_.emplace(storage_->scan(make_bytes_view(prefix)));
    row = cursor_->next();
  }
  if (!row) {
    return std::nullopt;
  }
  auto line = encoder.try_decode_record<journal_line_t>(
      make_bytes_view(row->second));
  if (!line) {
    throw storage_error{"corrupt line index row"};
  }
  return line;
}

ledger_store::ledger_store(storage_t& storage) : storage_{storage} {}

posting_result_t ledger_store::append(const journal_entry_t& entry,
                                      const std::vector<journal_line_t>& lines) {
  auto totals = totals_t{};
  if (auto error = check_lines(lines, totals)) {
    return *error;
  }

  auto encoder = encoder_t{};
  auto txn = storage_.begin();
  auto idempotency_key =
      tally::schema::key::make_idempotency_key(entry.idempotency_key());
  if (auto existing = txn.get_for_update(make_bytes_view(idempotency_key))) {
    return replay(txn, encoder, *existing);
  }

  auto posted = entry;
  posted.id = txn.next_sequence(encoder, tally::schema::key::kEntrySequenceKey);
  posted.entry_number = make_entry_number(posted.entry_date, posted.id);
  posted.status = entry_status_t::posted;
  posted.total_debit = totals.debit;
  posted.total_credit = totals.credit;
  posted.posted_at = tally::schema::now_milliseconds();
  posted.reversed_by.reset();

  auto stored_lines = number_lines(lines, posted.id);
  put_entry(txn, encoder, posted);
  put_lines(txn, encoder, posted.id, stored_lines);
  put_posted_index(txn, encoder, posted, stored_lines);
  put_idempotency_row(txn, encoder, posted);
  txn.commit();

  spdlog::info("Posted {} ({}, {}, {}) total {}", posted.entry_number,
               posted.source_type, posted.source_id, posted.purpose,
               tally::schema::format_amount(posted.total_debit));
  return make_entry_result(std::move(posted), std::move(stored_lines), false);
}

std::optional<journal_entry_t> ledger_store::find_by_idempotency_key(
    const tally::schema::idempotency_key_t& key) const {
  auto encoder = encoder_t{};
  auto idempotency_key = tally::schema::key::make_idempotency_key(key);
  auto raw = storage_.get_raw(make_bytes_view(idempotency_key));
  if (!raw) {
    return std::nullopt;
  }
  return find(decode_entry_id(encoder, *raw));
}

line_cursor ledger_store::lines_for_account(
    const tally::schema::account_id_t account_id,
    const bool posted_only) const {
  return line_cursor{storage_, account_id, posted_only};
}

posting_result_t ledger_store::void_entry(
    const entry_id_t entry_id,
    const std::string_view reason,
    const tally::schema::calendar_date_t date) {
  auto encoder = encoder_t{};
  auto txn = storage_.begin();

  auto entry_key = tally::schema::key::make_entry_key(entry_id);
  auto original =
      decode_entry(encoder, txn.get_for_update(make_bytes_view(entry_key)));
  if (!original) {
    return make_ledger_error(posting_error_code::entry_missing,
                             "entry does not exist",
                             std::to_string(entry_id));
  }
  if (original->status == entry_status_t::void_ && original->reversed_by) {
    auto reversal = read_entry(txn, encoder, *original->reversed_by);
    auto reversal_lines = read_lines(txn, encoder, reversal.id);
    return make_entry_result(std::move(reversal), std::move(reversal_lines),
                             true);
  }
  if (original->status != entry_status_t::posted ||
      original->reversal_of.has_value()) {
    return make_ledger_error(posting_error_code::entry_not_voidable,
                             "only posted, non-reversal entries can be voided",
                             original->entry_number);
  }

  auto reversal = journal_entry_t{};
  reversal.entry_date = date == 0 ? original->entry_date : date;
  reversal.description = fmt::format("Reversal of {}", original->entry_number);
  reversal.source_type = std::string{kReversalSourceType};
  reversal.source_id = original->id;
  reversal.purpose = std::string{kReversalPurpose};

  auto reversal_key =
      tally::schema::key::make_idempotency_key(reversal.idempotency_key());
  if (auto existing = txn.get_for_update(make_bytes_view(reversal_key))) {
    return replay(txn, encoder, *existing);
  }

  auto original_lines = read_lines(txn, encoder, original->id);
  reversal.id =
      txn.next_sequence(encoder, tally::schema::key::kEntrySequenceKey);
  auto reversal_lines = std::vector<journal_line_t>{};
  reversal_lines.reserve(original_lines.size());
  for (const auto& line : original_lines) {
    auto swapped = line;
    swapped.entry_id = reversal.id;
    swapped.debit = line.credit;
    swapped.credit = line.debit;
    reversal_lines.push_back(std::move(swapped));
  }

  reversal.entry_number = "REV-" + original->entry_number;
  reversal.status = entry_status_t::posted;
  reversal.total_debit = original->total_credit;
  reversal.total_credit = original->total_debit;
  reversal.posted_at = tally::schema::now_milliseconds();
  reversal.content_hash = content_fingerprint(reversal_lines);
  reversal.reversal_of = original->id;
  reversal.void_reason = std::string{reason};

  auto original_key =
      tally::schema::key::make_idempotency_key(original->idempotency_key());
  txn.erase(make_bytes_view(original_key));

  original->status = entry_status_t::void_;
  original->reversed_by = reversal.id;
  original->void_reason = std::string{reason};

  put_entry(txn, encoder, *original);
  put_entry(txn, encoder, reversal);
  put_lines(txn, encoder, reversal.id, reversal_lines);
  put_posted_index(txn, encoder, reversal, reversal_lines);
  put_idempotency_row(txn, encoder, reversal);
  txn.commit();

  spdlog::info("Voided {} with {}: {}", original->entry_number,
               reversal.entry_number, reason);
  return make_entry_result(std::move(reversal), std::move(reversal_lines),
                           false);
}

posting_result_t ledger_store::save_draft(
    const journal_entry_t& entry,
    const std::vector<journal_line_t>& lines) {
  auto totals = totals_t{};
  if (auto error = check_lines(lines, totals)) {
    return *error;
  }

  auto encoder = encoder_t{};
  auto txn = storage_.begin();
  auto idempotency_key =
      tally::schema::key::make_idempotency_key(entry.idempotency_key());
  if (auto existing = txn.get(make_bytes_view(idempotency_key))) {
    return replay(txn, encoder, *existing);
  }

  auto draft = entry;
  draft.id = txn.next_sequence(encoder, tally::schema::key::kEntrySequenceKey);
  draft.entry_number = make_entry_number(draft.entry_date, draft.id);
  draft.status = entry_status_t::draft;
  draft.total_debit = totals.debit;
  draft.total_credit = totals.credit;
  draft.posted_at = 0;

  auto stored_lines = number_lines(lines, draft.id);
  put_entry(txn, encoder, draft);
  put_lines(txn, encoder, draft.id, stored_lines);
  for (const auto& line : stored_lines) {
    auto key = tally::schema::key::make_draft_line_key(
        line.account_id, draft.id, line.line_number);
    auto value = encoder.encode_record(line);
    txn.put(make_bytes_view(key), make_bytes_view(value));
  }
  txn.commit();

  spdlog::info("Saved draft {} ({}, {}, {})", draft.entry_number,
               draft.source_type, draft.source_id, draft.purpose);
  return make_entry_result(std::move(draft), std::move(stored_lines), false);
}

posting_result_t ledger_store::promote_draft(const entry_id_t entry_id) {
  auto encoder = encoder_t{};
  auto txn = storage_.begin();

  auto entry_key = tally::schema::key::make_entry_key(entry_id);
  auto draft =
      decode_entry(encoder, txn.get_for_update(make_bytes_view(entry_key)));
  if (!draft) {
    return make_ledger_error(posting_error_code::entry_missing,
                             "entry does not exist",
                             std::to_string(entry_id));
  }
  if (draft->status != entry_status_t::draft) {
    return make_ledger_error(posting_error_code::entry_not_draft,
                             "only draft entries can be posted",
                             draft->entry_number);
  }

  auto idempotency_key =
      tally::schema::key::make_idempotency_key(draft->idempotency_key());
  if (auto existing = txn.get_for_update(make_bytes_view(idempotency_key))) {
    return replay(txn, encoder, *existing);
  }

  auto lines = read_lines(txn, encoder, draft->id);
  for (const auto& line : lines) {
    auto key = tally::schema::key::make_draft_line_key(
        line.account_id, draft->id, line.line_number);
    txn.erase(make_bytes_view(key));
  }

  draft->status = entry_status_t::posted;
  draft->posted_at = tally::schema::now_milliseconds();
  put_entry(txn, encoder, *draft);
  put_posted_index(txn, encoder, *draft, lines);
  put_idempotency_row(txn, encoder, *draft);
  txn.commit();

  spdlog::info("Posted draft {}", draft->entry_number);
  return make_entry_result(std::move(*draft), std::move(lines), false);
}

std::optional<journal_entry_t> ledger_store::find(
    const entry_id_t entry_id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_entry_key(entry_id);
  return storage_.get<journal_entry_t>(encoder, make_bytes_view(key));
}

std::vector<journal_line_t> ledger_store::lines(
    const entry_id_t entry_id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_entry_lines_key(entry_id);
  auto raw = storage_.get_raw(make_bytes_view(key));
  if (!raw) {
    return {};
  }
  return decode_lines(encoder, *raw);
}

std::vector<journal_entry_t> ledger_store::entries() const {
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kEntryPrefix);
  auto out = std::vector<journal_entry_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto entry = decode_entry(encoder, value);
    out.push_back(std::move(*entry));
  }
  return out;
}

trial_balance_t ledger_store::trial_balance() const {
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kPostedLinePrefix);
  auto totals = trial_balance_t{};
  auto cursor = storage_.scan(make_bytes_view(prefix));
  while (auto row = cursor.next()) {
    auto line = encoder.try_decode_record<journal_line_t>(
        make_bytes_view(row->second));
    if (!line) {
      throw storage_error{"corrupt line index row"};
    }
    auto debit = tally::schema::checked_add(totals.total_debit, line->debit);
    auto credit =
        tally::schema::checked_add(totals.total_credit, line->credit);
    if (!debit || !credit) {
      throw storage_error{"trial balance overflows"};
    }
    totals.total_debit = *debit;
    totals.total_credit = *credit;
    ++totals.line_count;
  }
  return totals;
}

tally::schema::hash32_t content_fingerprint(
    const std::vector<journal_line_t>& lines) {
  auto key = tally::schema::key::builder{};
  for (const auto& line : lines) {
    key.write(line.account_id)
        .write(line.debit)
        .write(line.credit)
        .write(static_cast<uint64_t>(line.description.size()))
        .write(std::string_view{line.description});
  }
  return tally::blake3::hash(make_bytes_view(key.data));
}

std::string make_entry_number(const tally::schema::calendar_date_t date,
                              const entry_id_t id) {
  return fmt::format("JE-{:04}{:02}-{:06}", tally::schema::year_of(date),
                     tally::schema::month_of(date), id);
}

}  // namespace tally::ledger
