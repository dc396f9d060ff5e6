#include <spdlog/spdlog.h>
#include <tally/mirror/cash_bank_registers.hpp>
#include <tally/schema/amount.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <cstddef>
#include <set>
#include <tuple>

namespace tally::mirror {

namespace {

using tally::schema::account_id_t;
using tally::schema::cash_bank_register_t;
using tally::schema::make_bytes_view;
using tally::schema::mirror_balance_t;
using tally::schema::posting_error_code;
using tally::schema::register_id_t;

open_result make_open_error(const posting_error_code code, std::string log) {
  return open_result{
      .code = static_cast<uint32_t>(code), .log = std::move(log), .value = {}};
}

mirror_balance_t to_mirror_balance(const cash_bank_register_t& record) {
  return mirror_balance_t{.target = std::string{kCashBankKind},
                          .record_id = record.id,
                          .account_id = record.account_id,
                          .balance = record.balance,
                          .refreshed_at = record.refreshed_at};
}

}  // namespace

cash_bank_registers::cash_bank_registers(
    storage_t& storage,
    const tally::directory::account_directory& directory)
    : storage_{storage}, directory_{directory} {}

open_result cash_bank_registers::open(const std::string_view code,
                                      const std::string_view name,
                                      const tally::schema::cash_bank_kind_t kind,
                                      const std::string_view account_code) {
  if (code.empty() || name.empty()) {
    return make_open_error(posting_error_code::invalid_proposal,
                           "register code and name are required");
  }
  auto account = directory_.find_by_code(account_code);
  if (!account) {
    return make_open_error(posting_error_code::account_missing,
                           "linked account does not exist");
  }
  if (!account->active) {
    return make_open_error(posting_error_code::account_inactive,
                           "linked account is retired");
  }
  if (account->is_header) {
    return make_open_error(posting_error_code::header_account,
                           "a register must link to a leaf account");
  }
  if (account->account_class != tally::schema::account_class_t::asset) {
    return make_open_error(posting_error_code::class_mismatch,
                           "a register must link to an asset account");
  }
  auto encoder = encoder_t{};
  auto record = cash_bank_register_t{};
  record.code = std::string{code};
  record.name = std::string{name};
  record.kind = kind;
  record.account_id = account->id;
  record.refreshed_at = tally::schema::now_milliseconds();

  try {
    auto txn = storage_.begin();
    auto code_key = tally::schema::key::make_cash_bank_code_key(code);
    if (txn.get_for_update(make_bytes_view(code_key))) {
      return make_open_error(posting_error_code::account_conflict,
                             "register code already in use");
    }
    record.id =
        txn.next_sequence(encoder, tally::schema::key::kRegisterSequenceKey);
    auto encoded_id = encoder.encode(record.id);
    txn.put(make_bytes_view(code_key), make_bytes_view(encoded_id));

    auto index_key =
        tally::schema::key::make_cash_bank_account_key(record.account_id);
    auto ids = std::vector<register_id_t>{};
    if (auto raw = txn.get_for_update(make_bytes_view(index_key))) {
      auto decoded =
          encoder.try_decode<std::vector<register_id_t>>(make_bytes_view(*raw));
      if (!decoded) {
        throw tally::storage::storage_error{"corrupt register index"};
      }
      ids = std::move(*decoded);
    }
    ids.push_back(record.id);
    auto encoded_ids = encoder.encode(ids);
    txn.put(make_bytes_view(index_key), make_bytes_view(encoded_ids));

    auto key = tally::schema::key::make_cash_bank_key(record.id);
    auto encoded = encoder.encode_record(record);
    txn.put(make_bytes_view(key), make_bytes_view(encoded));
    txn.commit();
  } catch (const tally::storage::storage_error& e) {
    return make_open_error(posting_error_code::storage_failure, e.what());
  }

  spdlog::info("Opened {} register {} on account {}",
               tally::schema::to_string(kind), record.code, account->code);
  return open_result{.code = 0, .log = {}, .value = std::move(record)};
}

open_result cash_bank_registers::close(const register_id_t id) {
  auto encoder = encoder_t{};
  auto record = std::optional<cash_bank_register_t>{};
  try {
    auto txn = storage_.begin();
    auto key = tally::schema::key::make_cash_bank_key(id);
    auto raw = txn.get_for_update(make_bytes_view(key));
    if (!raw) {
      return make_open_error(posting_error_code::register_missing,
                             "register does not exist");
    }
    record = encoder.try_decode_record<cash_bank_register_t>(
        make_bytes_view(*raw));
    if (!record) {
      throw tally::storage::storage_error{"corrupt cash/bank register"};
    }
    if (record->active) {
      record->active = false;
      auto encoded = encoder.encode_record(*record);
      txn.put(make_bytes_view(key), make_bytes_view(encoded));
      txn.commit();
      spdlog::info("Closed register {}", record->code);
    }
  } catch (const tally::storage::storage_error& e) {
    return make_open_error(posting_error_code::storage_failure, e.what());
  }
  return open_result{.code = 0, .log = {}, .value = std::move(record)};
}

std::optional<cash_bank_register_t> cash_bank_registers::find(
    const register_id_t id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_cash_bank_key(id);
  return storage_.get<cash_bank_register_t>(encoder, make_bytes_view(key));
}

std::vector<register_id_t> cash_bank_registers::register_ids(
    const account_id_t account_id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_cash_bank_account_key(account_id);
  return storage_
      .get_value<std::vector<register_id_t>>(encoder, make_bytes_view(key))
      .value_or(std::vector<register_id_t>{});
}

std::vector<cash_bank_register_t> cash_bank_registers::find_by_account(
    const account_id_t account_id) const {
  auto out = std::vector<cash_bank_register_t>{};
  for (const auto id : register_ids(account_id)) {
    if (auto record = find(id)) {
      out.push_back(std::move(*record));
    }
  }
  return out;
}

std::vector<cash_bank_register_t> cash_bank_registers::open_registers(
    const account_id_t account_id) const {
  auto out = find_by_account(account_id);
  std::erase_if(out, [](const auto& record) { return !record.active; });
  return out;
}

std::vector<cash_bank_register_t> cash_bank_registers::all() const {
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kCashBankPrefix);
  auto out = std::vector<cash_bank_register_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto record =
        encoder.try_decode_record<cash_bank_register_t>(make_bytes_view(value));
    if (!record) {
      throw tally::storage::storage_error{"corrupt cash/bank register"};
    }
    out.push_back(std::move(*record));
  }
  return out;
}

std::string_view cash_bank_registers::kind() const {
  return kCashBankKind;
}

std::vector<account_id_t> cash_bank_registers::mirrored_accounts() const {
  auto accounts = std::set<account_id_t>{};
  for (const auto& record : all()) {
    if (record.active) {
      accounts.insert(record.account_id);
    }
  }
  return {std::begin(accounts), std::end(accounts)};
}

bool cash_bank_registers::mirrors(const account_id_t account_id) const {
  return !open_registers(account_id).empty();
}

std::vector<mirror_balance_t> cash_bank_registers::refresh(
    const account_id_t account_id,
    const tally::schema::account_balance_t& balance) {
  auto encoder = encoder_t{};
  auto ids = register_ids(account_id);
  auto out = std::vector<mirror_balance_t>{};
  if (ids.empty()) {
    return out;
  }

  // Register rows are locked in id order for the whole refresh.
  auto txn = storage_.begin();
  auto written = std::size_t{0};
  for (const auto id : ids) {
    auto key = tally::schema::key::make_cash_bank_key(id);
    auto raw = txn.get_for_update(make_bytes_view(key));
    if (!raw) {
      continue;
    }
    auto record =
        encoder.try_decode_record<cash_bank_register_t>(make_bytes_view(*raw));
    if (!record) {
      throw tally::storage::storage_error{"corrupt cash/bank register"};
    }
    if (!record->active) {
      continue;
    }
    if (std::tie(record->last_entry_id, record->line_count) >
        std::tie(balance.last_entry_id, balance.line_count)) {
      spdlog::debug("Skipping stale refresh of register {} ({}/{} < {}/{})",
                    record->code, balance.last_entry_id, balance.line_count,
                    record->last_entry_id, record->line_count);
      out.push_back(to_mirror_balance(*record));
      continue;
    }
    record->balance = balance.balance;
    record->last_entry_id = balance.last_entry_id;
    record->line_count = balance.line_count;
    record->refreshed_at = tally::schema::now_milliseconds();
    auto encoded = encoder.encode_record(*record);
    txn.put(make_bytes_view(key), make_bytes_view(encoded));
    out.push_back(to_mirror_balance(*record));
    ++written;
  }
  txn.commit();

  spdlog::debug("Refreshed {} register(s) of account {} to {}", written,
                account_id, tally::schema::format_amount(balance.balance));
  return out;
}

std::vector<mirror_balance_t> cash_bank_registers::read(
    const account_id_t account_id) const {
  auto out = std::vector<mirror_balance_t>{};
  for (const auto& record : open_registers(account_id)) {
    out.push_back(to_mirror_balance(record));
  }
  return out;
}

}  // namespace tally::mirror
