#pragma once
#include <tally/schema/journal_line.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::journal_line_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::entry_id_t,
                          uint32_t,
                          tally::schema::account_id_t,
                          tally::schema::amount_t,
                          tally::schema::amount_t,
                          std::string>;

  static type to_record(const tally::schema::journal_line_t& value);
  static std::optional<tally::schema::journal_line_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
