#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tally::schema {

enum class consistency_warning_severity_t : uint8_t {
  info = 0,
  warning = 1,
  error = 2,
  critical = 3,
};

inline constexpr auto kConsistencyWarningSeverityMappings = std::array{
    std::pair<std::string_view, consistency_warning_severity_t>{
        "info", consistency_warning_severity_t::info},
    std::pair<std::string_view, consistency_warning_severity_t>{
        "warning", consistency_warning_severity_t::warning},
    std::pair<std::string_view, consistency_warning_severity_t>{
        "error", consistency_warning_severity_t::error},
    std::pair<std::string_view, consistency_warning_severity_t>{
        "critical", consistency_warning_severity_t::critical}};

inline constexpr std::string_view to_string(
    const consistency_warning_severity_t value) {
  return to_string(value, kConsistencyWarningSeverityMappings)
      .value_or("unknown");
}

}  // namespace tally::schema
