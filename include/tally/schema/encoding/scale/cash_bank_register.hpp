#pragma once
#include <tally/schema/cash_bank_register.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::cash_bank_register_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::register_id_t,
                          std::string,
                          std::string,
                          uint8_t,
                          tally::schema::account_id_t,
                          tally::schema::amount_t,
                          tally::schema::entry_id_t,
                          uint64_t,
                          bool,
                          tally::schema::timestamp_milliseconds_t>;

  static type to_record(const tally::schema::cash_bank_register_t& value);
  static std::optional<tally::schema::cash_bank_register_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
