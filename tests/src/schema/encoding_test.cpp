#include <gtest/gtest.h>
#include <tally/schema/encoding/scale/encoder.hpp>

#include <tuple>

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

TEST(encoding, journal_entry_keeps_every_field) {
  auto entry = tally::schema::journal_entry_t{};
  entry.id = 12;
  entry.entry_number = "REV-JE-202405-000011";
  entry.entry_date = 20240515;
  entry.description = "Reversal of JE-202405-000011";
  entry.source_type = "REVERSAL";
  entry.source_id = 11;
  entry.purpose = "VOID";
  entry.status = tally::schema::entry_status_t::posted;
  entry.total_debit = 222'000'000;
  entry.total_credit = 222'000'000;
  entry.posted_at = 1'715'731'200'000;
  entry.content_hash.fill(0x5A);
  entry.reversal_of = 11;
  entry.void_reason = "duplicate invoice";

  auto encoder = encoder_t{};
  auto bytes = encoder.encode_record(entry);
  auto decoded = encoder.try_decode_record<tally::schema::journal_entry_t>(
      tally::schema::make_bytes_view(bytes));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->entry_number, entry.entry_number);
  EXPECT_EQ(decoded->status, tally::schema::entry_status_t::posted);
  EXPECT_EQ(decoded->total_debit, entry.total_debit);
  EXPECT_EQ(decoded->content_hash, entry.content_hash);
  EXPECT_EQ(decoded->reversal_of, std::optional<uint64_t>{11});
  EXPECT_FALSE(decoded->reversed_by.has_value());
  EXPECT_EQ(decoded->void_reason, entry.void_reason);
  EXPECT_EQ(decoded->idempotency_key(), entry.idempotency_key());
}

TEST(encoding, unknown_account_class_is_rejected_on_decode) {
  using traits = tally::schema::encoding::record_traits<
      tally::schema::account_t>;
  auto account = tally::schema::account_t{};
  account.id = 4;
  account.code = "1101";
  account.name = "CASH";
  auto record = traits::to_record(account);
  std::get<4>(record) = uint8_t{17};

  auto encoder = encoder_t{};
  auto bytes = encoder.encode(record);
  EXPECT_FALSE(encoder
                   .try_decode_record<tally::schema::account_t>(
                       tally::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(encoding, truncated_bytes_do_not_decode) {
  auto balance = tally::schema::account_balance_t{};
  balance.account_id = 9;
  balance.balance = -500;
  auto encoder = encoder_t{};
  auto bytes = encoder.encode_record(balance);
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode_record<tally::schema::account_balance_t>(
                       tally::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(encoding, warning_keeps_optional_references) {
  auto warning = tally::schema::make_warning(
      tally::schema::consistency_warning_type_t::mirror_mismatch,
      tally::schema::consistency_warning_severity_t::warning, 7, 100, 90,
      "register CASH-01 drifted");
  warning.id = 3;
  auto encoder = encoder_t{};
  auto bytes = encoder.encode_record(warning);
  auto decoded =
      encoder.try_decode_record<tally::schema::consistency_warning_t>(
          tally::schema::make_bytes_view(bytes));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->type,
            tally::schema::consistency_warning_type_t::mirror_mismatch);
  EXPECT_EQ(decoded->account_id, std::optional<uint64_t>{7});
  EXPECT_FALSE(decoded->entry_id.has_value());
  EXPECT_EQ(decoded->expected, 100);
  EXPECT_EQ(decoded->actual, 90);
  EXPECT_FALSE(decoded->resolved);
}
