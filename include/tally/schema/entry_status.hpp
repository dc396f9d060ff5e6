#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: journal entry status.
// Ledger lifecycle: draft entries are stored but not part of the ledger
// history; posted entries are immutable; void marks a posted entry that a
// reversing entry offsets.
namespace tally::schema {

enum class entry_status_t : uint8_t { draft = 0, posted = 1, void_ = 2 };

inline constexpr auto kEntryStatusMappings = std::array{
    std::pair<std::string_view, entry_status_t>{"draft", entry_status_t::draft},
    std::pair<std::string_view, entry_status_t>{"posted",
                                                entry_status_t::posted},
    std::pair<std::string_view, entry_status_t>{"void", entry_status_t::void_}};

template <>
inline std::optional<entry_status_t> try_from_string<entry_status_t>(
    const std::string_view value) {
  return from_string(value, kEntryStatusMappings);
}

inline constexpr std::string_view to_string(const entry_status_t value) {
  return to_string(value, kEntryStatusMappings).value_or("unknown");
}

}  // namespace tally::schema
