#include <gtest/gtest.h>
#include <tally/schema/amount.hpp>

#include <limits>

using tally::schema::amount_t;

TEST(amount, make_amount_counts_minor_units) {
  EXPECT_EQ(tally::schema::make_amount(2'220'000), 222'000'000);
  EXPECT_EQ(tally::schema::make_amount(12, 5), 1205);
}

TEST(amount, parses_whole_and_fractional_text) {
  EXPECT_EQ(tally::schema::try_parse_amount("2220000"),
            tally::schema::make_amount(2'220'000));
  EXPECT_EQ(tally::schema::try_parse_amount("2220000.00"),
            tally::schema::make_amount(2'220'000));
  EXPECT_EQ(tally::schema::try_parse_amount("0.5"), amount_t{50});
  EXPECT_EQ(tally::schema::try_parse_amount("-90.00"), amount_t{-9000});
  EXPECT_EQ(tally::schema::try_parse_amount("+1.01"), amount_t{101});
}

TEST(amount, rejects_malformed_text) {
  EXPECT_FALSE(tally::schema::try_parse_amount("").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount("-").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount(".50").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount("1.").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount("1.005").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount("1,000").has_value());
  EXPECT_FALSE(tally::schema::try_parse_amount("12a").has_value());
}

TEST(amount, rejects_values_outside_int64) {
  EXPECT_FALSE(
      tally::schema::try_parse_amount("92233720368547758.08").has_value());
  EXPECT_EQ(tally::schema::try_parse_amount("92233720368547758.07"),
            std::numeric_limits<amount_t>::max());
  EXPECT_EQ(tally::schema::try_parse_amount("-92233720368547758.08"),
            std::numeric_limits<amount_t>::min());
}

TEST(amount, formats_with_two_decimals) {
  EXPECT_EQ(tally::schema::format_amount(0), "0.00");
  EXPECT_EQ(tally::schema::format_amount(5), "0.05");
  EXPECT_EQ(tally::schema::format_amount(-123405), "-1234.05");
  EXPECT_EQ(tally::schema::format_amount(tally::schema::make_amount(2'220'000)),
            "2220000.00");
  EXPECT_EQ(
      tally::schema::format_amount(std::numeric_limits<amount_t>::min()),
      "-92233720368547758.08");
}

TEST(amount, checked_arithmetic_reports_overflow) {
  constexpr auto max = std::numeric_limits<amount_t>::max();
  constexpr auto min = std::numeric_limits<amount_t>::min();
  EXPECT_EQ(tally::schema::checked_add(1, 2), amount_t{3});
  EXPECT_FALSE(tally::schema::checked_add(max, 1).has_value());
  EXPECT_FALSE(tally::schema::checked_subtract(min, 1).has_value());
  EXPECT_FALSE(tally::schema::checked_negate(min).has_value());
  EXPECT_EQ(tally::schema::apply_sign(-1, 250), amount_t{-250});
  EXPECT_EQ(tally::schema::apply_sign(1, -250), amount_t{-250});
}
