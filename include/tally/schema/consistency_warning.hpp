#pragma once
#include <tally/schema/consistency_warning_severity.hpp>
#include <tally/schema/consistency_warning_type.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>
#include <utility>

namespace tally::schema {

template <uint16_t Version>
struct consistency_warning;

template <>
struct consistency_warning<1> final {
  uint16_t version{1};
  warning_id_t id{};
  consistency_warning_type_t type{};
  consistency_warning_severity_t severity{
      consistency_warning_severity_t::warning};
  std::optional<account_id_t> account_id;
  std::optional<entry_id_t> entry_id;
  amount_t expected{};
  amount_t actual{};
  std::string message;
  timestamp_milliseconds_t recorded_at{};
  bool resolved{};
  timestamp_milliseconds_t resolved_at{};
};

using consistency_warning_t = consistency_warning<1>;

/// Unsaved warning (id 0); the warning log assigns the id on record.
inline consistency_warning_t make_warning(
    const consistency_warning_type_t type,
    const consistency_warning_severity_t severity,
    const std::optional<account_id_t> account_id,
    const amount_t expected,
    const amount_t actual,
    std::string message) {
  auto warning = consistency_warning_t{};
  warning.type = type;
  warning.severity = severity;
  warning.account_id = account_id;
  warning.expected = expected;
  warning.actual = actual;
  warning.message = std::move(message);
  warning.recorded_at = now_milliseconds();
  return warning;
}

}  // namespace tally::schema
