#include <tally/schema/encoding/scale/account.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<account_t>::type record_traits<account_t>::to_record(
    const account_t& value) {
  return type{value.version,
              value.id,
              value.code,
              value.name,
              static_cast<uint8_t>(value.account_class),
              value.is_header,
              value.active,
              value.parent_id};
}

std::optional<account_t> record_traits<account_t>::from_record(
    const type& record) {
  auto account_class =
      from_underlying(std::get<4>(record), kAccountClassMappings);
  if (!account_class) {
    return std::nullopt;
  }
  return account_t{.version = std::get<0>(record),
                   .id = std::get<1>(record),
                   .code = std::get<2>(record),
                   .name = std::get<3>(record),
                   .account_class = *account_class,
                   .is_header = std::get<5>(record),
                   .active = std::get<6>(record),
                   .parent_id = std::get<7>(record)};
}

}  // namespace tally::schema::encoding
