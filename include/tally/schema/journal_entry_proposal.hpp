#pragma once
#include <tally/schema/idempotency_key.hpp>
#include <tally/schema/primitives.hpp>
#include <string>
#include <utility>
#include <vector>

// Schema type: journal entry proposal.
// What a business-event producer (sales, purchase, cash/bank service) hands to
// the posting engine. Accounts are referenced by code.
namespace tally::schema {

struct proposal_line_t final {
  std::string account_code;
  amount_t debit{};
  amount_t credit{};
  std::string description;
};

struct journal_entry_proposal_t final {
  std::string source_type;
  source_id_t source_id{};
  std::string purpose;
  calendar_date_t entry_date{};
  std::string description;
  std::vector<proposal_line_t> lines;

  idempotency_key_t idempotency_key() const {
    return idempotency_key_t{
        .source_type = source_type, .source_id = source_id, .purpose = purpose};
  }
};

inline proposal_line_t debit_line(std::string account_code,
                                  const amount_t amount,
                                  std::string description = {}) {
  return proposal_line_t{.account_code = std::move(account_code),
                         .debit = amount,
                         .credit = 0,
                         .description = std::move(description)};
}

inline proposal_line_t credit_line(std::string account_code,
                                   const amount_t amount,
                                   std::string description = {}) {
  return proposal_line_t{.account_code = std::move(account_code),
                         .debit = 0,
                         .credit = amount,
                         .description = std::move(description)};
}

}  // namespace tally::schema
