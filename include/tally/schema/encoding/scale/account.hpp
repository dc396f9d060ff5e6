#pragma once
#include <tally/schema/account.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tally::schema::encoding {

template <>
struct record_traits<tally::schema::account_t> final {
  using type = std::tuple<uint16_t,
                          tally::schema::account_id_t,
                          std::string,
                          std::string,
                          uint8_t,
                          bool,
                          bool,
                          std::optional<tally::schema::account_id_t>>;

  static type to_record(const tally::schema::account_t& value);
  static std::optional<tally::schema::account_t> from_record(
      const type& record);
};

}  // namespace tally::schema::encoding
