#pragma once
#include <tally/schema/consistency_warning.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::consistency_warning_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::warning_id_t,
                          uint8_t,
                          uint8_t,
                          std::optional<tally::schema::account_id_t>,
                          std::optional<tally::schema::entry_id_t>,
                          tally::schema::amount_t,
                          tally::schema::amount_t,
                          std::string,
                          tally::schema::timestamp_milliseconds_t,
                          bool,
                          tally::schema::timestamp_milliseconds_t>;

  static type to_record(const tally::schema::consistency_warning_t& value);
  static std::optional<tally::schema::consistency_warning_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
