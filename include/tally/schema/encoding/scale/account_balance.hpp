#pragma once
#include <tally/schema/account_balance.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::account_balance_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::account_id_t,
                          tally::schema::amount_t,
                          tally::schema::amount_t,
                          tally::schema::amount_t,
                          uint64_t,
                          tally::schema::entry_id_t,
                          tally::schema::timestamp_milliseconds_t>;

  static type to_record(const tally::schema::account_balance_t& value);
  static std::optional<tally::schema::account_balance_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
