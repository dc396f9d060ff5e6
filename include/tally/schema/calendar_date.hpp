#pragma once

#include <tally/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Entry dates are packed YYYYMMDD integers so that numeric order is calendar
// order and they encode as a single u32.
namespace tally::schema {

constexpr calendar_date_t make_date(const uint32_t year,
                                    const uint32_t month,
                                    const uint32_t day) {
  return (year * 10000u) + (month * 100u) + day;
}

constexpr uint32_t year_of(const calendar_date_t date) {
  return date / 10000u;
}

constexpr uint32_t month_of(const calendar_date_t date) {
  return (date / 100u) % 100u;
}

constexpr uint32_t day_of(const calendar_date_t date) {
  return date % 100u;
}

/// True for a real Gregorian date between 1900-01-01 and 9999-12-31.
bool is_valid_date(calendar_date_t date);

/// Parse "2024-05-31" or "20240531".
std::optional<calendar_date_t> try_parse_date(std::string_view text);

/// Render as "2024-05-31".
std::string format_date(calendar_date_t date);

}  // namespace tally::schema
