#include <gtest/gtest.h>
#include <tally/mirror/cash_bank_registers.hpp>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/testing/ledger_fixture.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using tally::schema::cash_bank_kind_t;
using tally::schema::make_amount;
using tally::schema::posting_error_code;
using tally::testing::ledger_fixture;

/// Mirrors one account, always reads back a stale balance and refuses every
/// write.
class unwritable_target final : public tally::mirror::mirror_target {
 public:
  std::string_view kind() const override { return "unwritable"; }

  std::vector<tally::schema::account_id_t> mirrored_accounts() const override {
    return {account_id};
  }

  bool mirrors(const tally::schema::account_id_t id) const override {
    return id == account_id;
  }

  std::vector<tally::schema::mirror_balance_t> refresh(
      tally::schema::account_id_t,
      const tally::schema::account_balance_t&) override {
    ++attempts;
    throw std::runtime_error{"target offline"};
  }

  std::vector<tally::schema::mirror_balance_t> read(
      const tally::schema::account_id_t id) const override {
    if (id != account_id) {
      return {};
    }
    return {tally::schema::mirror_balance_t{.target = "unwritable",
                                            .record_id = 1,
                                            .account_id = id,
                                            .balance = -1,
                                            .refreshed_at = 0}};
  }

  tally::schema::account_id_t account_id{};
  int attempts{};
};

tally::schema::cash_bank_register_t open_cash_register(
    ledger_fixture& fixture) {
  auto opened = fixture.registers().open("CASH-01", "Front desk till",
                                         cash_bank_kind_t::cash,
                                         tally::testing::kCash);
  if (!opened.ok()) {
    throw std::runtime_error{"failed to open register: " + opened.log};
  }
  return *opened.value;
}

}  // namespace

TEST(cash_bank_registers, open_links_an_asset_leaf) {
  auto fixture = ledger_fixture{"tally_mirror_open"};
  auto record = open_cash_register(fixture);
  EXPECT_EQ(record.id, 1u);
  EXPECT_EQ(record.balance, 0);
  EXPECT_EQ(record.account_id, fixture.account_id(tally::testing::kCash));

  auto& registers = fixture.registers();
  EXPECT_TRUE(registers.mirrors(record.account_id));
  EXPECT_FALSE(
      registers.mirrors(fixture.account_id(tally::testing::kBank)));
  EXPECT_EQ(registers.find_by_account(record.account_id).size(), 1u);
  EXPECT_EQ(registers.mirrored_accounts(),
            std::vector<tally::schema::account_id_t>{record.account_id});

  auto till = registers.open("CASH-02", "Back office till",
                             cash_bank_kind_t::cash, tally::testing::kCash);
  ASSERT_TRUE(till.ok());
  EXPECT_EQ(registers.find_by_account(record.account_id).size(), 2u);
  EXPECT_EQ(registers.all().size(), 2u);
}

TEST(cash_bank_registers, open_rejects_unsuitable_accounts) {
  auto fixture = ledger_fixture{"tally_mirror_reject"};
  auto& registers = fixture.registers();
  EXPECT_EQ(registers.open("X", "Header", cash_bank_kind_t::bank, "1100")
                .error(),
            posting_error_code::header_account);
  EXPECT_EQ(registers
                .open("X", "Revenue", cash_bank_kind_t::bank,
                      tally::testing::kSalesRevenue)
                .error(),
            posting_error_code::class_mismatch);
  EXPECT_EQ(registers.open("X", "Ghost", cash_bank_kind_t::bank, "1999")
                .error(),
            posting_error_code::account_missing);
  EXPECT_EQ(registers.open("", "No code", cash_bank_kind_t::bank, "1102")
                .error(),
            posting_error_code::invalid_proposal);

  ASSERT_TRUE(fixture.directory().retire("1503").ok());
  EXPECT_EQ(registers.open("X", "Retired", cash_bank_kind_t::bank, "1503")
                .error(),
            posting_error_code::account_inactive);

  ASSERT_TRUE(
      registers.open("BANK-01", "Operating", cash_bank_kind_t::bank, "1102")
          .ok());
  EXPECT_EQ(
      registers.open("BANK-01", "Duplicate", cash_bank_kind_t::bank, "1102")
          .error(),
      posting_error_code::account_conflict);
}

TEST(cash_bank_registers, concurrent_opens_reserve_a_code_once) {
  auto fixture = ledger_fixture{"tally_mirror_open_race"};
  constexpr auto kThreads = 8;
  auto opened = std::atomic<int>{0};
  auto conflicts = std::atomic<int>{0};
  auto start = std::atomic<bool>{false};

  auto workers = std::vector<std::thread>{};
  for (auto i = 0; i < kThreads; ++i) {
    workers.emplace_back([&] {
      while (!start.load()) {
        std::this_thread::yield();
      }
      auto result = fixture.registers().open(
          "CASH-01", "Till", cash_bank_kind_t::cash, tally::testing::kCash);
      if (result.ok()) {
        ++opened;
      } else if (result.error() == posting_error_code::account_conflict) {
        ++conflicts;
      }
    });
  }
  start = true;
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(opened.load(), 1);
  EXPECT_EQ(conflicts.load(), kThreads - 1);
  EXPECT_EQ(fixture.registers().all().size(), 1u);
  EXPECT_EQ(fixture.registers()
                .find_by_account(fixture.account_id(tally::testing::kCash))
                .size(),
            1u);
}

TEST(cash_bank_registers, closed_registers_are_no_longer_mirrored) {
  auto fixture = ledger_fixture{"tally_mirror_close"};
  auto front = open_cash_register(fixture);
  auto back = fixture.registers().open("CASH-02", "Back office till",
                                       cash_bank_kind_t::cash,
                                       tally::testing::kCash);
  ASSERT_TRUE(back.ok());

  auto closed = fixture.registers().close(back.value->id);
  ASSERT_TRUE(closed.ok()) << closed.log;
  EXPECT_FALSE(closed.value->active);
  EXPECT_TRUE(fixture.registers().close(back.value->id).ok());
  EXPECT_EQ(fixture.registers().close(99).error(),
            posting_error_code::register_missing);

  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_invoice(7)).ok());
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_payment(7)).ok());
  EXPECT_EQ(fixture.registers().find(front.id)->balance,
            make_amount(2'220'000));
  EXPECT_EQ(fixture.registers().find(back.value->id)->balance, 0);
  EXPECT_EQ(fixture.registers().read(front.account_id).size(), 1u);
  EXPECT_TRUE(fixture.mirrors().validate(front.account_id));

  ASSERT_TRUE(fixture.registers().close(front.id).ok());
  EXPECT_FALSE(fixture.registers().mirrors(front.account_id));
  EXPECT_TRUE(fixture.registers().mirrored_accounts().empty());
  auto stop = std::atomic<bool>{false};
  EXPECT_EQ(fixture.mirrors().sweep(stop).accounts_checked, 0u);
  EXPECT_EQ(fixture.registers().all().size(), 2u);

  EXPECT_EQ(fixture.registers()
                .open("CASH-02", "Reused code", cash_bank_kind_t::cash,
                      tally::testing::kCash)
                .error(),
            posting_error_code::account_conflict);
}

TEST(mirror_adapter, posting_refreshes_the_cash_register) {
  auto fixture = ledger_fixture{"tally_mirror_payment"};
  auto record = open_cash_register(fixture);
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_invoice(42)).ok());
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_payment(42)).ok());

  auto refreshed = fixture.registers().find(record.id);
  ASSERT_TRUE(refreshed.has_value());
  EXPECT_EQ(refreshed->balance, make_amount(2'220'000));
  EXPECT_EQ(refreshed->balance, fixture.balance_of(tally::testing::kCash));
  EXPECT_TRUE(fixture.mirrors().validate(record.account_id));
}

TEST(mirror_adapter, validate_detects_a_tampered_register) {
  auto fixture = ledger_fixture{"tally_mirror_validate"};
  auto record = open_cash_register(fixture);
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_invoice(1)).ok());
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_payment(1)).ok());

  fixture.tamper_register(record.id, make_amount(10));
  EXPECT_FALSE(fixture.mirrors().validate(record.account_id));

  auto balances = fixture.mirrors().refresh(record.account_id);
  ASSERT_EQ(balances.size(), 1u);
  EXPECT_EQ(balances[0].target, tally::mirror::kCashBankKind);
  EXPECT_EQ(balances[0].record_id, record.id);
  EXPECT_EQ(balances[0].balance, make_amount(2'220'000));
  EXPECT_TRUE(fixture.mirrors().validate(record.account_id));
}

TEST(mirror_adapter, sweep_repairs_divergent_registers_only) {
  auto fixture = ledger_fixture{"tally_mirror_sweep"};
  auto cash = open_cash_register(fixture);
  auto bank = fixture.registers().open("BANK-01", "Operating",
                                       cash_bank_kind_t::bank,
                                       tally::testing::kBank);
  ASSERT_TRUE(bank.ok());
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_invoice(2)).ok());
  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_payment(2)).ok());
  fixture.tamper_register(cash.id, 0);

  auto stop = std::atomic<bool>{false};
  auto report = fixture.mirrors().sweep(stop);
  EXPECT_FALSE(report.interrupted);
  EXPECT_EQ(report.accounts_checked, 2u);
  EXPECT_EQ(report.refreshed, 1u);
  ASSERT_EQ(report.warnings.size(), 1u);
  EXPECT_EQ(report.warnings[0].type,
            tally::schema::consistency_warning_type_t::mirror_mismatch);
  EXPECT_EQ(report.warnings[0].expected, make_amount(2'220'000));
  EXPECT_EQ(report.warnings[0].actual, 0);
  EXPECT_EQ(fixture.registers().find(cash.id)->balance,
            make_amount(2'220'000));

  auto again = fixture.mirrors().sweep(stop);
  EXPECT_EQ(again.refreshed, 0u);
  EXPECT_TRUE(again.warnings.empty());
}

TEST(mirror_adapter, sweep_stops_when_asked) {
  auto fixture = ledger_fixture{"tally_mirror_stop"};
  open_cash_register(fixture);
  auto stop = std::atomic<bool>{true};
  auto report = fixture.mirrors().sweep(stop);
  EXPECT_TRUE(report.interrupted);
  EXPECT_EQ(report.accounts_checked, 0u);
}

TEST(mirror_adapter, failed_refresh_becomes_a_warning) {
  auto target = unwritable_target{};
  auto fixture = ledger_fixture{"tally_mirror_failure"};
  target.account_id = fixture.account_id(tally::testing::kCash);
  fixture.mirrors().add_target(target);

  EXPECT_THROW(fixture.mirrors().refresh(target.account_id),
               std::runtime_error);

  auto stop = std::atomic<bool>{false};
  auto report = fixture.mirrors().sweep(stop);
  ASSERT_EQ(report.warnings.size(), 2u);
  EXPECT_EQ(report.warnings[0].type,
            tally::schema::consistency_warning_type_t::mirror_mismatch);
  EXPECT_EQ(report.warnings[1].type,
            tally::schema::consistency_warning_type_t::mirror_write_failed);
  EXPECT_EQ(report.refreshed, 0u);
  EXPECT_EQ(target.attempts, 2);
}

TEST(mirror_adapter, posting_survives_a_failing_mirror) {
  auto target = unwritable_target{};
  auto fixture = ledger_fixture{"tally_mirror_post_failure"};
  target.account_id = fixture.account_id(tally::testing::kCash);
  fixture.mirrors().add_target(target);

  ASSERT_TRUE(fixture.engine().post(tally::testing::sale_invoice(3)).ok());
  auto payment = fixture.engine().post(tally::testing::sale_payment(3));
  ASSERT_TRUE(payment.ok()) << payment.log;
  EXPECT_EQ(fixture.balance_of(tally::testing::kCash),
            make_amount(2'220'000));

  auto pending = fixture.warnings().pending();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].type,
            tally::schema::consistency_warning_type_t::mirror_write_failed);
  EXPECT_EQ(pending[0].account_id, target.account_id);
  EXPECT_EQ(pending[0].entry_id, payment.entry->id);
}

TEST(cash_bank_registers, refresh_never_reverts_to_an_older_entry) {
  auto fixture = ledger_fixture{"tally_mirror_ordering"};
  auto record = open_cash_register(fixture);
  auto& registers = fixture.registers();

  auto newer = tally::schema::account_balance_t{};
  newer.account_id = record.account_id;
  newer.balance = make_amount(200);
  newer.last_entry_id = 5;
  newer.line_count = 2;
  auto older = newer;
  older.balance = make_amount(100);
  older.last_entry_id = 3;
  older.line_count = 1;

  registers.refresh(record.account_id, newer);
  auto kept = registers.refresh(record.account_id, older);
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].balance, make_amount(200));
  EXPECT_EQ(registers.find(record.id)->balance, make_amount(200));
  EXPECT_EQ(registers.find(record.id)->last_entry_id, 5u);

  auto same_entry = newer;
  same_entry.balance = make_amount(250);
  registers.refresh(record.account_id, same_entry);
  EXPECT_EQ(registers.find(record.id)->balance, make_amount(250));

  // A promoted draft adds lines under an entry id older than the newest one.
  auto promoted = newer;
  promoted.balance = make_amount(300);
  promoted.line_count = 3;
  registers.refresh(record.account_id, promoted);
  auto before_promotion = registers.refresh(record.account_id, newer);
  ASSERT_EQ(before_promotion.size(), 1u);
  EXPECT_EQ(before_promotion[0].balance, make_amount(300));
  EXPECT_EQ(registers.find(record.id)->line_count, 3u);
}

TEST(mirror_adapter, concurrent_posts_leave_the_register_current) {
  auto fixture = ledger_fixture{"tally_mirror_post_race"};
  auto record = open_cash_register(fixture);
  constexpr auto kThreads = 8;
  constexpr auto kPostsPerThread = 5;
  auto rejected = std::atomic<int>{0};
  auto start = std::atomic<bool>{false};

  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      while (!start.load()) {
        std::this_thread::yield();
      }
      for (auto i = 0; i < kPostsPerThread; ++i) {
        auto source_id =
            static_cast<tally::schema::source_id_t>(t * kPostsPerThread + i + 1);
        auto posted = fixture.engine().post(tally::testing::make_proposal(
            "CAPITAL", source_id, "INJECTION",
            {tally::schema::debit_line(std::string{tally::testing::kCash},
                                       make_amount(100)),
             tally::schema::credit_line(
                 std::string{tally::testing::kOwnerCapital},
                 make_amount(100))}));
        if (!posted.ok()) {
          ++rejected;
        }
      }
    });
  }
  start = true;
  for (auto& worker : workers) {
    worker.join();
  }

  ASSERT_EQ(rejected.load(), 0);
  auto projected = fixture.projector().balance(record.account_id);
  ASSERT_TRUE(projected.has_value());
  EXPECT_EQ(projected->balance, make_amount(100) * kThreads * kPostsPerThread);
  auto mirrored = fixture.registers().find(record.id);
  EXPECT_EQ(mirrored->balance, projected->balance);
  EXPECT_EQ(mirrored->last_entry_id, projected->last_entry_id);
  EXPECT_TRUE(fixture.mirrors().validate(record.account_id));
}
