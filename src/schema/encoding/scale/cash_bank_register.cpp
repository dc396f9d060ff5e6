#include <tally/schema/encoding/scale/cash_bank_register.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<cash_bank_register_t>::type
record_traits<cash_bank_register_t>::to_record(
    const cash_bank_register_t& value) {
  return type{value.version,
              value.id,
              value.code,
              value.name,
              static_cast<uint8_t>(value.kind),
              value.account_id,
              value.balance,
              value.last_entry_id,
              value.line_count,
              value.active,
              value.refreshed_at};
}

std::optional<cash_bank_register_t>
record_traits<cash_bank_register_t>::from_record(const type& record) {
  auto kind = from_underlying(std::get<4>(record), kCashBankKindMappings);
  if (!kind) {
    return std::nullopt;
  }
  return cash_bank_register_t{.version = std::get<0>(record),
                              .id = std::get<1>(record),
                              .code = std::get<2>(record),
                              .name = std::get<3>(record),
                              .kind = *kind,
                              .account_id = std::get<5>(record),
                              .balance = std::get<6>(record),
                              .last_entry_id = std::get<7>(record),
                              .line_count = std::get<8>(record),
                              .active = std::get<9>(record),
                              .refreshed_at = std::get<10>(record)};
}

}  // namespace tally::schema::encoding
