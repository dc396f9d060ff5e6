#pragma once

#include <tally/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Fixed-point money: an amount_t counts minor units with two fractional
// digits. All ledger arithmetic is exact integer arithmetic; nothing is ever
// rounded.
namespace tally::schema {

inline constexpr int kAmountDecimals = 2;
inline constexpr amount_t kAmountScale = 100;

/// Amount for a whole number of major units (e.g. 2220000 -> "2220000.00").
constexpr amount_t make_amount(const int64_t major, const int64_t minor = 0) {
  return (major * kAmountScale) + minor;
}

/// Parse "2220000", "2220000.5", "2220000.50" or "-90.00". Rejects more than
/// two fractional digits, stray characters and values outside int64 range.
std::optional<amount_t> try_parse_amount(std::string_view text);

/// Render with exactly two fractional digits, e.g. "-1234.05".
std::string format_amount(amount_t value);

std::optional<amount_t> checked_add(amount_t lhs, amount_t rhs);
std::optional<amount_t> checked_subtract(amount_t lhs, amount_t rhs);
std::optional<amount_t> checked_negate(amount_t value);

/// Multiply by +1/-1 (normal balance sign) without overflow.
std::optional<amount_t> apply_sign(int64_t sign, amount_t value);

}  // namespace tally::schema
