#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: account class.
// Chart of accounts: closed classification deciding an account's normal
// balance side. Never compared as free text.
namespace tally::schema {

enum class account_class_t : uint8_t {
  asset = 0,
  liability = 1,
  equity = 2,
  revenue = 3,
  expense = 4
};

inline constexpr auto kAccountClassMappings =
    std::array{std::pair<std::string_view, account_class_t>{
                   "asset", account_class_t::asset},
               std::pair<std::string_view, account_class_t>{
                   "liability", account_class_t::liability},
               std::pair<std::string_view, account_class_t>{
                   "equity", account_class_t::equity},
               std::pair<std::string_view, account_class_t>{
                   "revenue", account_class_t::revenue},
               std::pair<std::string_view, account_class_t>{
                   "expense", account_class_t::expense}};

template <>
inline std::optional<account_class_t> try_from_string<account_class_t>(
    const std::string_view value) {
  return from_string(value, kAccountClassMappings);
}

inline constexpr std::string_view to_string(const account_class_t value) {
  return to_string(value, kAccountClassMappings).value_or("unknown");
}

/// +1 for debit-normal classes (asset, expense), -1 for credit-normal classes
/// (liability, equity, revenue).
inline constexpr int64_t normal_sign(const account_class_t value) {
  switch (value) {
    case account_class_t::asset:
    case account_class_t::expense:
      return 1;
    case account_class_t::liability:
    case account_class_t::equity:
    case account_class_t::revenue:
      return -1;
  }
  return 1;
}

inline constexpr bool is_credit_normal(const account_class_t value) {
  return normal_sign(value) < 0;
}

}  // namespace tally::schema
