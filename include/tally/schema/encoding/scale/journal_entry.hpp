#pragma once
#include <tally/schema/journal_entry.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::journal_entry_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::entry_id_t,
                          std::string,
                          tally::schema::calendar_date_t,
                          std::string,
                          std::string,
                          tally::schema::source_id_t,
                          std::string,
                          uint8_t,
                          tally::schema::amount_t,
                          tally::schema::amount_t,
                          tally::schema::timestamp_milliseconds_t,
                          tally::schema::hash32_t,
                          std::optional<tally::schema::entry_id_t>,
                          std::optional<tally::schema::entry_id_t>,
                          std::string>;

  static type to_record(const tally::schema::journal_entry_t& value);
  static std::optional<tally::schema::journal_entry_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
