#pragma once

#include <tally/directory/account_directory.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/mirror/cash_bank_registers.hpp>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/posting/engine.hpp>
#include <tally/projection/balance_projector.hpp>
#include <tally/reconciliation/reconciler.hpp>
#include <tally/reconciliation/warning_log.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <tally/testing/common.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace tally::testing {

/// Full in-process ledger over a throwaway RocksDB directory, seeded with the
/// default chart of accounts.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          const tally::posting::engine_options options = {},
                          const bool seed_chart = true)
      : db_path_{make_db_path(db_prefix)},
        storage_{tally::storage::make_storage<
            tally::storage::rocksdb_storage_tag>(db_path_)},
        directory_{storage_},
        ledger_{storage_},
        projector_{storage_, directory_, ledger_},
        registers_{storage_, directory_},
        mirrors_{projector_},
        warnings_{storage_},
        engine_{directory_, ledger_, projector_, mirrors_, warnings_, options},
        reconciler_{directory_, ledger_, projector_, mirrors_, warnings_} {
    mirrors_.add_target(registers_);
    if (seed_chart) {
      auto seeded = tally::directory::seed(directory_,
                                           tally::directory::default_chart());
      if (!seeded.ok()) {
        throw std::runtime_error{"failed to seed chart: " + seeded.log};
      }
    }
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  tally::storage::rocksdb_storage_t& storage() { return storage_; }
  tally::directory::account_directory& directory() { return directory_; }
  tally::ledger::ledger_store& ledger() { return ledger_; }
  tally::projection::balance_projector& projector() { return projector_; }
  tally::mirror::cash_bank_registers& registers() { return registers_; }
  tally::mirror::mirror_adapter& mirrors() { return mirrors_; }
  tally::reconciliation::warning_log& warnings() { return warnings_; }
  tally::posting::engine& engine() { return engine_; }
  tally::reconciliation::reconciler& reconciler() { return reconciler_; }

  tally::schema::account_id_t account_id(const std::string_view code) const {
    auto account = directory_.find_by_code(code);
    if (!account) {
      throw std::runtime_error{"unknown account " + std::string{code}};
    }
    return account->id;
  }

  /// Cached projected balance, zero when the account was never projected.
  tally::schema::amount_t balance_of(const std::string_view code) const {
    auto balance = projector_.balance(account_id(code));
    return balance ? balance->balance : tally::schema::amount_t{0};
  }

  /// Overwrite a cached balance behind the projector's back.
  void tamper_balance(const std::string_view code,
                      const tally::schema::amount_t value) {
    auto encoder = tally::projection::encoder_t{};
    auto balance = projector_.balance(account_id(code))
                       .value_or(tally::schema::account_balance_t{});
    balance.account_id = account_id(code);
    balance.balance = value;
    auto key = tally::schema::key::make_balance_key(balance.account_id);
    storage_.put(encoder, tally::schema::make_bytes_view(key), balance);
  }

  /// Overwrite a register balance behind the mirror adapter's back.
  void tamper_register(const tally::schema::register_id_t id,
                       const tally::schema::amount_t value) {
    auto encoder = tally::mirror::encoder_t{};
    auto record = registers_.find(id);
    if (!record) {
      throw std::runtime_error{"unknown register"};
    }
    record->balance = value;
    auto key = tally::schema::key::make_cash_bank_key(id);
    storage_.put(encoder, tally::schema::make_bytes_view(key), *record);
  }

 private:
  std::string db_path_;
  tally::storage::rocksdb_storage_t storage_;
  tally::directory::account_directory directory_;
  tally::ledger::ledger_store ledger_;
  tally::projection::balance_projector projector_;
  tally::mirror::cash_bank_registers registers_;
  tally::mirror::mirror_adapter mirrors_;
  tally::reconciliation::warning_log warnings_;
  tally::posting::engine engine_;
  tally::reconciliation::reconciler reconciler_;
};

}  // namespace tally::testing
