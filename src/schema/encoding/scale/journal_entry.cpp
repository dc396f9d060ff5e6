#include <tally/schema/encoding/scale/journal_entry.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<journal_entry_t>::type record_traits<journal_entry_t>::to_record(
    const journal_entry_t& value) {
  return type{value.version,
              value.id,
              value.entry_number,
              value.entry_date,
              value.description,
              value.source_type,
              value.source_id,
              value.purpose,
              static_cast<uint8_t>(value.status),
              value.total_debit,
              value.total_credit,
              value.posted_at,
              value.content_hash,
              value.reversal_of,
              value.reversed_by,
              value.void_reason};
}

std::optional<journal_entry_t> record_traits<journal_entry_t>::from_record(
    const type& record) {
  auto status = from_underlying(std::get<8>(record), kEntryStatusMappings);
  if (!status) {
    return std::nullopt;
  }
  auto entry = journal_entry_t{};
  entry.version = std::get<0>(record);
  entry.id = std::get<1>(record);
  entry.entry_number = std::get<2>(record);
  entry.entry_date = std::get<3>(record);
  entry.description = std::get<4>(record);
  entry.source_type = std::get<5>(record);
  entry.source_id = std::get<6>(record);
  entry.purpose = std::get<7>(record);
  entry.status = *status;
  entry.total_debit = std::get<9>(record);
  entry.total_credit = std::get<10>(record);
  entry.posted_at = std::get<11>(record);
  entry.content_hash = std::get<12>(record);
  entry.reversal_of = std::get<13>(record);
  entry.reversed_by = std::get<14>(record);
  entry.void_reason = std::get<15>(record);
  return entry;
}

}  // namespace tally::schema::encoding
