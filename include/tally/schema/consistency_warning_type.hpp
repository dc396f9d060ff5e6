#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: consistency warning type.
// Derived-state divergences found by projection, mirroring and
// reconciliation. Each one is queued for a recompute-from-source pass.
namespace tally::schema {

enum class consistency_warning_type_t : uint8_t {
  rollup_mismatch = 0,
  balance_drift = 1,
  mirror_mismatch = 2,
  mirror_write_failed = 3,
  projection_failed = 4,
  trial_balance_mismatch = 5,
  accounting_equation_mismatch = 6,
  hierarchy_invalid = 7,
  idempotent_content_mismatch = 8
};

inline constexpr auto kConsistencyWarningTypeMappings = std::array{
    std::pair<std::string_view, consistency_warning_type_t>{
        "rollup_mismatch", consistency_warning_type_t::rollup_mismatch},
    std::pair<std::string_view, consistency_warning_type_t>{
        "balance_drift", consistency_warning_type_t::balance_drift},
    std::pair<std::string_view, consistency_warning_type_t>{
        "mirror_mismatch", consistency_warning_type_t::mirror_mismatch},
    std::pair<std::string_view, consistency_warning_type_t>{
        "mirror_write_failed", consistency_warning_type_t::mirror_write_failed},
    std::pair<std::string_view, consistency_warning_type_t>{
        "projection_failed", consistency_warning_type_t::projection_failed},
    std::pair<std::string_view, consistency_warning_type_t>{
        "trial_balance_mismatch",
        consistency_warning_type_t::trial_balance_mismatch},
    std::pair<std::string_view, consistency_warning_type_t>{
        "accounting_equation_mismatch",
        consistency_warning_type_t::accounting_equation_mismatch},
    std::pair<std::string_view, consistency_warning_type_t>{
        "hierarchy_invalid", consistency_warning_type_t::hierarchy_invalid},
    std::pair<std::string_view, consistency_warning_type_t>{
        "idempotent_content_mismatch",
        consistency_warning_type_t::idempotent_content_mismatch}};

template <>
inline std::optional<consistency_warning_type_t>
try_from_string<consistency_warning_type_t>(const std::string_view value) {
  return from_string(value, kConsistencyWarningTypeMappings);
}

inline constexpr std::string_view to_string(
    const consistency_warning_type_t value) {
  return to_string(value, kConsistencyWarningTypeMappings).value_or("unknown");
}

}  // namespace tally::schema
