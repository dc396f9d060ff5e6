#pragma once

#include <tally/schema/amount.hpp>
#include <tally/schema/calendar_date.hpp>
#include <tally/schema/journal_entry_proposal.hpp>
#include <tally/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tally::testing {

inline constexpr auto kReceivable = std::string_view{"1201"};
inline constexpr auto kCash = std::string_view{"1101"};
inline constexpr auto kBank = std::string_view{"1102"};
inline constexpr auto kCurrentAssets = std::string_view{"1100"};
inline constexpr auto kSalesRevenue = std::string_view{"4101"};
inline constexpr auto kVatOutput = std::string_view{"2103"};
inline constexpr auto kOwnerCapital = std::string_view{"3101"};
inline constexpr auto kGeneralExpense = std::string_view{"5900"};

inline constexpr auto kEntryDate = tally::schema::make_date(2024, 5, 15);

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline tally::schema::journal_entry_proposal_t make_proposal(
    std::string source_type,
    const tally::schema::source_id_t source_id,
    std::string purpose,
    std::vector<tally::schema::proposal_line_t> lines,
    const tally::schema::calendar_date_t date = kEntryDate) {
  auto proposal = tally::schema::journal_entry_proposal_t{};
  proposal.source_type = std::move(source_type);
  proposal.source_id = source_id;
  proposal.purpose = std::move(purpose);
  proposal.entry_date = date;
  proposal.description = proposal.source_type + " " +
                         std::to_string(source_id) + " " + proposal.purpose;
  proposal.lines = std::move(lines);
  return proposal;
}

/// Sale of 2,000,000 plus 220,000 output VAT on account.
inline tally::schema::journal_entry_proposal_t sale_invoice(
    const tally::schema::source_id_t sale_id) {
  using tally::schema::make_amount;
  return make_proposal(
      "SALE", sale_id, "INVOICE",
      {tally::schema::debit_line(std::string{kReceivable},
                                 make_amount(2'220'000), "invoice total"),
       tally::schema::credit_line(std::string{kSalesRevenue},
                                  make_amount(2'000'000), "sales"),
       tally::schema::credit_line(std::string{kVatOutput},
                                  make_amount(220'000), "output VAT")});
}

/// Cash receipt settling `sale_invoice`.
inline tally::schema::journal_entry_proposal_t sale_payment(
    const tally::schema::source_id_t sale_id) {
  using tally::schema::make_amount;
  return make_proposal(
      "SALE", sale_id, "PAYMENT",
      {tally::schema::debit_line(std::string{kCash}, make_amount(2'220'000)),
       tally::schema::credit_line(std::string{kReceivable},
                                  make_amount(2'220'000))});
}

}  // namespace tally::testing
