#include <tally/schema/encoding/scale/consistency_warning.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<consistency_warning_t>::type
record_traits<consistency_warning_t>::to_record(
    const consistency_warning_t& value) {
  return type{value.version,
              value.id,
              static_cast<uint8_t>(value.type),
              static_cast<uint8_t>(value.severity),
              value.account_id,
              value.entry_id,
              value.expected,
              value.actual,
              value.message,
              value.recorded_at,
              value.resolved,
              value.resolved_at};
}

std::optional<consistency_warning_t>
record_traits<consistency_warning_t>::from_record(const type& record) {
  auto warning_type =
      from_underlying(std::get<2>(record), kConsistencyWarningTypeMappings);
  auto severity =
      from_underlying(std::get<3>(record), kConsistencyWarningSeverityMappings);
  if (!warning_type || !severity) {
    return std::nullopt;
  }
  auto warning = consistency_warning_t{};
  warning.version = std::get<0>(record);
  warning.id = std::get<1>(record);
  warning.type = *warning_type;
  warning.severity = *severity;
  warning.account_id = std::get<4>(record);
  warning.entry_id = std::get<5>(record);
  warning.expected = std::get<6>(record);
  warning.actual = std::get<7>(record);
  warning.message = std::get<8>(record);
  warning.recorded_at = std::get<9>(record);
  warning.resolved = std::get<10>(record);
  warning.resolved_at = std::get<11>(record);
  return warning;
}

}  // namespace tally::schema::encoding
