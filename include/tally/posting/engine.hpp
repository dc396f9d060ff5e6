#pragma once
#include <tally/directory/account_directory.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/projection/balance_projector.hpp>
#include <tally/reconciliation/warning_log.hpp>
#include <tally/schema/journal_entry_proposal.hpp>
#include <tally/schema/posting_result.hpp>
#include <string_view>
#include <vector>

namespace tally::posting {

inline constexpr auto kCodespace = std::string_view{"tally.posting"};

struct engine_options final {
  /// Entries dated on or before this date are rejected. 0 leaves every
  /// period open.
  tally::schema::calendar_date_t closed_through{};
};

/// The only path by which money moves. A post is validated against the chart,
/// appended atomically, then projected and mirrored. Projection and mirror
/// failures never undo a committed entry; they are queued as warnings for
/// reconciliation.
class engine final {
 public:
  engine(const tally::directory::account_directory& directory,
         tally::ledger::ledger_store& ledger,
         tally::projection::balance_projector& projector,
         tally::mirror::mirror_adapter& mirrors,
         tally::reconciliation::warning_log& warnings,
         engine_options options = {});

  tally::schema::posting_result_t post(
      const tally::schema::journal_entry_proposal_t& proposal);

  /// Validate and store as DRAFT; balances are untouched.
  tally::schema::posting_result_t draft(
      const tally::schema::journal_entry_proposal_t& proposal);

  tally::schema::posting_result_t post_draft(tally::schema::entry_id_t entry_id);

  /// Reverse a posted entry. A zero `date` dates the reversal like the
  /// original.
  tally::schema::posting_result_t void_entry(tally::schema::entry_id_t entry_id,
                                             std::string_view reason,
                                             tally::schema::calendar_date_t date);

  const engine_options& options() const { return options_; }

 private:
  struct resolved_proposal final {
    tally::schema::journal_entry_t entry;
    std::vector<tally::schema::journal_line_t> lines;
  };

  tally::schema::posting_result_t resolve(
      const tally::schema::journal_entry_proposal_t& proposal,
      resolved_proposal& out) const;
  tally::schema::posting_result_t check_date(
      tally::schema::calendar_date_t date) const;
  void propagate(const tally::schema::journal_entry_t& entry,
                 const std::vector<tally::schema::journal_line_t>& lines);
  void queue(tally::schema::consistency_warning_t warning);

  const tally::directory::account_directory& directory_;
  tally::ledger::ledger_store& ledger_;
  tally::projection::balance_projector& projector_;
  tally::mirror::mirror_adapter& mirrors_;
  tally::reconciliation::warning_log& warnings_;
  engine_options options_;
};

}  // namespace tally::posting
