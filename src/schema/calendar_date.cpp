#include <tally/schema/calendar_date.hpp>

#include <array>
#include <cstdio>

namespace tally::schema {

namespace {

bool is_leap_year(const uint32_t year) {
  return (year % 4u == 0u && year % 100u != 0u) || year % 400u == 0u;
}

uint32_t days_in_month(const uint32_t year, const uint32_t month) {
  static constexpr auto kDays =
      std::array<uint32_t, 12>{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

}  // namespace

bool is_valid_date(const calendar_date_t date) {
  const auto year = year_of(date);
  const auto month = month_of(date);
  const auto day = day_of(date);
  if (year < 1900 || year > 9999 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  return day <= days_in_month(year, month);
}

std::optional<calendar_date_t> try_parse_date(const std::string_view text) {
  auto digits = std::string{};
  for (const auto c : text) {
    if (c == '-') {
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    digits.push_back(c);
  }
  if (digits.size() != 8 || (text.size() != 8 && text.size() != 10)) {
    return std::nullopt;
  }
  if (text.size() == 10 && (text[4] != '-' || text[7] != '-')) {
    return std::nullopt;
  }
  const auto date = static_cast<calendar_date_t>(std::stoul(digits));
  if (!is_valid_date(date)) {
    return std::nullopt;
  }
  return date;
}

std::string format_date(const calendar_date_t date) {
  auto buffer = std::array<char, 16>{};
  std::snprintf(buffer.data(), buffer.size(), "%04u-%02u-%02u", year_of(date),
                month_of(date), day_of(date));
  return std::string{buffer.data()};
}

}  // namespace tally::schema
