#include <gtest/gtest.h>
#include <tally/schema/account_class.hpp>
#include <tally/schema/cash_bank_kind.hpp>
#include <tally/schema/consistency_warning_type.hpp>
#include <tally/schema/entry_status.hpp>
#include <tally/schema/posting_error_code.hpp>

using tally::schema::account_class_t;

TEST(enum_types, account_class_parses_case_insensitively) {
  EXPECT_EQ(tally::schema::try_from_string<account_class_t>("REVENUE"),
            account_class_t::revenue);
  EXPECT_EQ(tally::schema::try_from_string<account_class_t>("Revenue"),
            account_class_t::revenue);
  EXPECT_EQ(tally::schema::try_from_string<account_class_t>("revenue"),
            account_class_t::revenue);
  EXPECT_FALSE(
      tally::schema::try_from_string<account_class_t>("income").has_value());
  EXPECT_FALSE(
      tally::schema::try_from_string<account_class_t>("revenues").has_value());
}

TEST(enum_types, normal_sign_is_fixed_per_class) {
  EXPECT_EQ(tally::schema::normal_sign(account_class_t::asset), 1);
  EXPECT_EQ(tally::schema::normal_sign(account_class_t::expense), 1);
  EXPECT_EQ(tally::schema::normal_sign(account_class_t::liability), -1);
  EXPECT_EQ(tally::schema::normal_sign(account_class_t::equity), -1);
  EXPECT_EQ(tally::schema::normal_sign(account_class_t::revenue), -1);
  EXPECT_TRUE(tally::schema::is_credit_normal(account_class_t::revenue));
  EXPECT_FALSE(tally::schema::is_credit_normal(account_class_t::asset));
}

TEST(enum_types, stored_discriminants_outside_the_mapping_are_rejected) {
  EXPECT_EQ(tally::schema::from_underlying(
                uint8_t{2}, tally::schema::kEntryStatusMappings),
            tally::schema::entry_status_t::void_);
  EXPECT_FALSE(tally::schema::from_underlying(
                   uint8_t{9}, tally::schema::kAccountClassMappings)
                   .has_value());
}

TEST(enum_types, names_render_for_logs) {
  EXPECT_EQ(tally::schema::to_string(tally::schema::entry_status_t::void_),
            "void");
  EXPECT_EQ(tally::schema::to_string(tally::schema::cash_bank_kind_t::bank),
            "bank");
  EXPECT_EQ(tally::schema::to_string(
                tally::schema::consistency_warning_type_t::rollup_mismatch),
            "rollup_mismatch");
  EXPECT_EQ(tally::schema::to_string(
                tally::schema::posting_error_code::unbalanced_entry),
            "unbalanced_entry");
}

TEST(enum_types, only_validation_codes_count_as_validation_errors) {
  using tally::schema::posting_error_code;
  EXPECT_TRUE(
      tally::schema::is_validation_error(posting_error_code::header_account));
  EXPECT_TRUE(
      tally::schema::is_validation_error(posting_error_code::period_closed));
  EXPECT_FALSE(
      tally::schema::is_validation_error(posting_error_code::unbalanced_entry));
  EXPECT_FALSE(tally::schema::is_validation_error(posting_error_code::ok));
  EXPECT_FALSE(
      tally::schema::is_validation_error(posting_error_code::storage_failure));
}
