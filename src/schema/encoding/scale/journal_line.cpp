#include <tally/schema/encoding/scale/journal_line.hpp>

using namespace tally::schema;

namespace tally::schema::encoding {

record_traits<journal_line_t>::type record_traits<journal_line_t>::to_record(
    const journal_line_t& value) {
  return type{value.version,    value.entry_id, value.line_number,
              value.account_id, value.debit,    value.credit,
              value.description};
}

std::optional<journal_line_t> record_traits<journal_line_t>::from_record(
    const type& record) {
  return journal_line_t{.version = std::get<0>(record),
                        .entry_id = std::get<1>(record),
                        .line_number = std::get<2>(record),
                        .account_id = std::get<3>(record),
                        .debit = std::get<4>(record),
                        .credit = std::get<5>(record),
                        .description = std::get<6>(record)};
}

}  // namespace tally::schema::encoding
