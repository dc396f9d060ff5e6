#include <tally/schema/encoding/scale/account_balance.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<account_balance_t>::type
record_traits<account_balance_t>::to_record(const account_balance_t& value) {
  return type{value.version,      value.account_id,   value.balance,
              value.total_debit,  value.total_credit, value.line_count,
              value.last_entry_id, value.projected_at};
}

std::optional<account_balance_t> record_traits<account_balance_t>::from_record(
    const type& record) {
  return account_balance_t{.version = std::get<0>(record),
                           .account_id = std::get<1>(record),
                           .balance = std::get<2>(record),
                           .total_debit = std::get<3>(record),
                           .total_credit = std::get<4>(record),
                           .line_count = std::get<5>(record),
                           .last_entry_id = std::get<6>(record),
                           .projected_at = std::get<7>(record)};
}

}  // namespace tally::schema::encoding
