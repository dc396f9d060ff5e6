#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class cash_bank_kind_t : uint8_t { cash = 0, bank = 1 };

inline constexpr auto kCashBankKindMappings = std::array{
    std::pair<std::string_view, cash_bank_kind_t>{"cash",
                                                  cash_bank_kind_t::cash},
    std::pair<std::string_view, cash_bank_kind_t>{"bank",
                                                  cash_bank_kind_t::bank}};

template <>
inline std::optional<cash_bank_kind_t> try_from_string<cash_bank_kind_t>(
    const std::string_view value) {
  return from_string(value, kCashBankKindMappings);
}

inline constexpr std::string_view to_string(const cash_bank_kind_t value) {
  return to_string(value, kCashBankKindMappings).value_or("unknown");
}

}  // namespace tally::schema
