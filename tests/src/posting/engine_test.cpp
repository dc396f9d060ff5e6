#include <gtest/gtest.h>
#include <tally/posting/engine.hpp>
#include <tally/schema/key/builder.hpp>
#include <tally/testing/ledger_fixture.hpp>

#include <atomic>
#include <limits>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using tally::schema::credit_line;
using tally::schema::debit_line;
using tally::schema::make_amount;
using tally::schema::posting_error_code;
using tally::testing::ledger_fixture;
using tally::testing::make_proposal;

}  // namespace

TEST(posting_engine, unbalanced_entry_writes_nothing) {
  auto fixture = ledger_fixture{"tally_posting_unbalanced"};
  auto proposal = make_proposal(
      "ADJUSTMENT", 1, "MANUAL",
      {debit_line(std::string{tally::testing::kCash}, 100),
       credit_line(std::string{tally::testing::kOwnerCapital}, 90)});

  auto result = fixture.engine().post(proposal);
  EXPECT_EQ(result.error(), posting_error_code::unbalanced_entry);
  EXPECT_EQ(result.codespace, tally::posting::kCodespace);
  EXPECT_FALSE(result.entry.has_value());
  EXPECT_TRUE(fixture.ledger().entries().empty());
  EXPECT_EQ(fixture.balance_of(tally::testing::kCash), 0);
  EXPECT_EQ(fixture.balance_of(tally::testing::kOwnerCapital), 0);
  EXPECT_TRUE(fixture.warnings().pending().empty());
}

TEST(posting_engine, duplicate_key_returns_the_first_entry) {
  auto fixture = ledger_fixture{"tally_posting_duplicate"};
  auto first = fixture.engine().post(tally::testing::sale_invoice(42));
  ASSERT_TRUE(first.ok()) << first.log;
  auto second = fixture.engine().post(tally::testing::sale_invoice(42));
  ASSERT_TRUE(second.ok()) << second.log;

  EXPECT_FALSE(first.replayed);
  EXPECT_TRUE(second.replayed);
  EXPECT_EQ(second.entry->id, first.entry->id);
  EXPECT_EQ(fixture.ledger().entries().size(), 1u);
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable),
            make_amount(2'220'000));
  EXPECT_TRUE(fixture.warnings().pending().empty());
}

TEST(posting_engine, header_account_is_not_postable) {
  auto fixture = ledger_fixture{"tally_posting_header"};
  auto proposal = make_proposal(
      "ADJUSTMENT", 2, "MANUAL",
      {debit_line(std::string{tally::testing::kCurrentAssets}, 500),
       credit_line(std::string{tally::testing::kOwnerCapital}, 500)});

  auto result = fixture.engine().post(proposal);
  EXPECT_EQ(result.error(), posting_error_code::header_account);
  EXPECT_TRUE(tally::schema::is_validation_error(result.error()));
  EXPECT_EQ(result.info, tally::testing::kCurrentAssets);
  EXPECT_TRUE(fixture.ledger().entries().empty());
}

TEST(posting_engine, concurrent_duplicates_post_once) {
  auto fixture = ledger_fixture{"tally_posting_race"};
  constexpr auto kThreads = 8;
  auto ids = std::vector<tally::schema::entry_id_t>(kThreads);
  auto failures = std::atomic<int>{0};
  auto start = std::atomic<bool>{false};

  auto workers = std::vector<std::thread>{};
  for (auto i = 0; i < kThreads; ++i) {
    workers.emplace_back([&, i] {
      while (!start.load()) {
        std::this_thread::yield();
      }
      auto result = fixture.engine().post(tally::testing::sale_invoice(42));
      if (!result.ok() || !result.entry) {
        ++failures;
        return;
      }
      ids[i] = result.entry->id;
    });
  }
  start = true;
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(std::set<tally::schema::entry_id_t>(ids.begin(), ids.end()).size(),
            1u);
  EXPECT_EQ(fixture.ledger().entries().size(), 1u);
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable),
            make_amount(2'220'000));
  EXPECT_TRUE(fixture.ledger().trial_balance().balanced());
}

TEST(posting_engine, malformed_proposals_are_rejected) {
  auto fixture = ledger_fixture{"tally_posting_malformed"};
  auto cash = std::string{tally::testing::kCash};
  auto capital = std::string{tally::testing::kOwnerCapital};
  auto& engine = fixture.engine();

  EXPECT_EQ(engine.post(make_proposal("ADJ", 1, "M", {debit_line(cash, 1)}))
                .error(),
            posting_error_code::invalid_proposal);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "", 1, "M", {debit_line(cash, 1), credit_line(capital, 1)}))
                .error(),
            posting_error_code::invalid_proposal);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, "M",
                    {debit_line(cash, -5), credit_line(capital, -5)}))
                .error(),
            posting_error_code::invalid_amount);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, "M",
                    {tally::schema::proposal_line_t{
                         .account_code = cash, .debit = 5, .credit = 5},
                     credit_line(capital, 0)}))
                .error(),
            posting_error_code::invalid_line);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, "M",
                    {debit_line("9999", 1), credit_line(capital, 1)}))
                .error(),
            posting_error_code::account_missing);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, "M",
                    {debit_line(cash, 1), credit_line(capital, 1)}, 20230229))
                .error(),
            posting_error_code::invalid_date);

  ASSERT_TRUE(fixture.directory().retire("1503").ok());
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, "M",
                    {debit_line("1503", 1), credit_line(capital, 1)}))
                .error(),
            posting_error_code::account_inactive);

  auto max = std::numeric_limits<tally::schema::amount_t>::max();
  EXPECT_EQ(engine
                .post(make_proposal("ADJ", 1, "M",
                                    {debit_line(cash, max),
                                     debit_line(cash, 1),
                                     credit_line(capital, 1)}))
                .error(),
            posting_error_code::invalid_amount);
  EXPECT_TRUE(fixture.ledger().entries().empty());
}

TEST(posting_engine, source_keys_longer_than_the_key_format_are_rejected) {
  auto fixture = ledger_fixture{"tally_posting_long_keys"};
  auto cash = std::string{tally::testing::kCash};
  auto capital = std::string{tally::testing::kOwnerCapital};
  auto& engine = fixture.engine();
  auto longest = std::string(tally::schema::key::kMaxSizedLength, 'S');

  auto first = engine.post(make_proposal(
      longest + "A", 1, "M", {debit_line(cash, 1), credit_line(capital, 1)}));
  EXPECT_EQ(first.error(), posting_error_code::invalid_proposal);
  auto second = engine.post(make_proposal(
      longest + "B", 1, "M", {debit_line(cash, 2), credit_line(capital, 2)}));
  EXPECT_EQ(second.error(), posting_error_code::invalid_proposal);
  EXPECT_EQ(engine
                .post(make_proposal(
                    "ADJ", 1, longest + "P",
                    {debit_line(cash, 3), credit_line(capital, 3)}))
                .error(),
            posting_error_code::invalid_proposal);
  EXPECT_TRUE(fixture.ledger().entries().empty());

  auto at_limit = engine.post(make_proposal(
      longest, 1, "M", {debit_line(cash, 4), credit_line(capital, 4)}));
  ASSERT_TRUE(at_limit.ok()) << at_limit.log;
  EXPECT_FALSE(at_limit.replayed);
  auto other_purpose = engine.post(make_proposal(
      longest, 1, "N", {debit_line(cash, 5), credit_line(capital, 5)}));
  ASSERT_TRUE(other_purpose.ok()) << other_purpose.log;
  EXPECT_FALSE(other_purpose.replayed);
  EXPECT_EQ(fixture.ledger().entries().size(), 2u);
  EXPECT_EQ(fixture.balance_of(tally::testing::kCash), 9);
}

TEST(posting_engine, closed_periods_reject_entries) {
  auto options = tally::posting::engine_options{};
  options.closed_through = tally::schema::make_date(2024, 4, 30);
  auto fixture = ledger_fixture{"tally_posting_closed", options};

  auto closed = tally::testing::sale_invoice(1);
  closed.entry_date = tally::schema::make_date(2024, 4, 30);
  auto result = fixture.engine().post(closed);
  EXPECT_EQ(result.error(), posting_error_code::period_closed);
  EXPECT_EQ(result.info, "2024-04-30 <= 2024-04-30");

  auto open = tally::testing::sale_invoice(1);
  open.entry_date = tally::schema::make_date(2024, 5, 1);
  EXPECT_TRUE(fixture.engine().post(open).ok());
  EXPECT_EQ(fixture.engine().options().closed_through, 20240430u);
}

TEST(posting_engine, replay_with_different_lines_is_flagged) {
  auto fixture = ledger_fixture{"tally_posting_mismatch"};
  auto first = fixture.engine().post(tally::testing::sale_invoice(5));
  ASSERT_TRUE(first.ok());

  auto altered = tally::testing::sale_invoice(5);
  altered.lines[0].debit = make_amount(2'220'001);
  altered.lines[1].credit = make_amount(2'000'001);
  auto replay = fixture.engine().post(altered);
  ASSERT_TRUE(replay.ok());
  EXPECT_TRUE(replay.replayed);
  EXPECT_EQ(replay.entry->id, first.entry->id);
  EXPECT_EQ(replay.entry->total_debit, make_amount(2'220'000));

  auto pending = fixture.warnings().pending();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].type,
            tally::schema::consistency_warning_type_t::
                idempotent_content_mismatch);
  EXPECT_EQ(pending[0].entry_id, first.entry->id);
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable),
            make_amount(2'220'000));
}

TEST(posting_engine, void_restores_balances) {
  auto fixture = ledger_fixture{"tally_posting_void"};
  auto invoice = fixture.engine().post(tally::testing::sale_invoice(8));
  ASSERT_TRUE(invoice.ok());

  EXPECT_EQ(fixture.engine().void_entry(invoice.entry->id, "", 0).error(),
            posting_error_code::invalid_proposal);

  auto reversal =
      fixture.engine().void_entry(invoice.entry->id, "customer cancelled", 0);
  ASSERT_TRUE(reversal.ok()) << reversal.log;
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable), 0);
  EXPECT_EQ(fixture.balance_of(tally::testing::kSalesRevenue), 0);
  EXPECT_EQ(fixture.balance_of(tally::testing::kVatOutput), 0);
  EXPECT_EQ(fixture.balance_of("1000"), 0);

  auto reposted = fixture.engine().post(tally::testing::sale_invoice(8));
  ASSERT_TRUE(reposted.ok());
  EXPECT_FALSE(reposted.replayed);
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable),
            make_amount(2'220'000));
}

TEST(posting_engine, void_into_a_closed_period_is_rejected) {
  auto options = tally::posting::engine_options{};
  options.closed_through = tally::schema::make_date(2024, 5, 31);
  auto fixture = ledger_fixture{"tally_posting_void_closed", options};

  auto june = tally::testing::sale_invoice(9);
  june.entry_date = tally::schema::make_date(2024, 6, 3);
  auto invoice = fixture.engine().post(june);
  ASSERT_TRUE(invoice.ok());

  EXPECT_EQ(fixture.engine()
                .void_entry(invoice.entry->id, "late",
                            tally::schema::make_date(2024, 5, 20))
                .error(),
            posting_error_code::period_closed);
  EXPECT_TRUE(fixture.engine()
                  .void_entry(invoice.entry->id, "late",
                              tally::schema::make_date(2024, 6, 4))
                  .ok());
}

TEST(posting_engine, drafts_post_only_when_promoted) {
  auto fixture = ledger_fixture{"tally_posting_draft"};
  auto draft = fixture.engine().draft(tally::testing::sale_invoice(10));
  ASSERT_TRUE(draft.ok()) << draft.log;
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable), 0);

  auto unbalanced = tally::testing::sale_invoice(11);
  unbalanced.lines.pop_back();
  EXPECT_EQ(fixture.engine().draft(unbalanced).error(),
            posting_error_code::unbalanced_entry);

  auto posted = fixture.engine().post_draft(draft.entry->id);
  ASSERT_TRUE(posted.ok()) << posted.log;
  EXPECT_EQ(fixture.balance_of(tally::testing::kReceivable),
            make_amount(2'220'000));
  EXPECT_EQ(fixture.balance_of("4000"), make_amount(2'000'000));

  EXPECT_EQ(fixture.engine().post_draft(draft.entry->id).error(),
            posting_error_code::entry_not_draft);
}

TEST(posting_engine, draft_promotion_rechecks_accounts) {
  auto fixture = ledger_fixture{"tally_posting_draft_retired"};
  auto draft = fixture.engine().draft(tally::testing::sale_invoice(12));
  ASSERT_TRUE(draft.ok());
  ASSERT_TRUE(fixture.directory().retire(tally::testing::kVatOutput).ok());

  auto result = fixture.engine().post_draft(draft.entry->id);
  EXPECT_EQ(result.error(), posting_error_code::account_inactive);
  EXPECT_EQ(fixture.ledger().find(draft.entry->id)->status,
            tally::schema::entry_status_t::draft);
}
