#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/posting/engine.hpp>
#include <tally/schema/amount.hpp>
#include <tally/schema/calendar_date.hpp>
#include <tally/schema/key/builder.hpp>
#include <exception>
#include <set>

namespace tally::posting {

namespace {

using tally::schema::amount_t;
using tally::schema::consistency_warning_severity_t;
using tally::schema::consistency_warning_type_t;
using tally::schema::journal_entry_proposal_t;
using tally::schema::journal_entry_t;
using tally::schema::journal_line_t;
using tally::schema::posting_error_code;
using tally::schema::posting_result_t;

posting_result_t make_posting_error(const posting_error_code code,
                                    std::string log,
                                    std::string info = {}) {
  return tally::schema::make_error(code, std::move(log), std::move(info),
                                   std::string{kCodespace});
}

posting_result_t accepted() {
  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  return result;
}

std::string describe(const journal_entry_proposal_t& proposal) {
  return fmt::format("({}, {}, {})", proposal.source_type, proposal.source_id,
                     proposal.purpose);
}

posting_result_t storage_failure(const std::exception& e) {
  spdlog::error("Ledger write failed: {}", e.what());
  return make_posting_error(posting_error_code::storage_failure,
                            "ledger write failed; nothing was posted",
                            e.what());
}

}  // namespace

engine::engine(const tally::directory::account_directory& directory,
               tally::ledger::ledger_store& ledger,
               tally::projection::balance_projector& projector,
               tally::mirror::mirror_adapter& mirrors,
               tally::reconciliation::warning_log& warnings,
               engine_options options)
    : directory_{directory},
      ledger_{ledger},
      projector_{projector},
      mirrors_{mirrors},
      warnings_{warnings},
      options_{options} {}

posting_result_t engine::check_date(
    const tally::schema::calendar_date_t date) const {
  if (!tally::schema::is_valid_date(date)) {
    return make_posting_error(posting_error_code::invalid_date,
                              "entry date is not a calendar date",
                              std::to_string(date));
  }
  if (options_.closed_through != 0 && date <= options_.closed_through) {
    return make_posting_error(
        posting_error_code::period_closed, "entry date is in a closed period",
        fmt::format("{} <= {}", tally::schema::format_date(date),
                    tally::schema::format_date(options_.closed_through)));
  }
  return accepted();
}

posting_result_t engine::resolve(const journal_entry_proposal_t& proposal,
                                 resolved_proposal& out) const {
  if (proposal.source_type.empty() || proposal.purpose.empty()) {
    return make_posting_error(posting_error_code::invalid_proposal,
                              "source type and purpose are required");
  }
  if (proposal.source_type.size() > tally::schema::key::kMaxSizedLength ||
      proposal.purpose.size() > tally::schema::key::kMaxSizedLength) {
    return make_posting_error(
        posting_error_code::invalid_proposal,
        "source type and purpose are limited to 65535 bytes",
        fmt::format("source type {} bytes, purpose {} bytes",
                    proposal.source_type.size(), proposal.purpose.size()));
  }
  if (proposal.lines.size() < 2) {
    return make_posting_error(posting_error_code::invalid_proposal,
                              "an entry needs at least two lines");
  }
  if (auto date = check_date(proposal.entry_date); !date.ok()) {
    return date;
  }

  auto total_debit = amount_t{0};
  auto total_credit = amount_t{0};
  out.lines.clear();
  out.lines.reserve(proposal.lines.size());
  for (const auto& line : proposal.lines) {
    if (line.debit < 0 || line.credit < 0) {
      return make_posting_error(posting_error_code::invalid_amount,
                                "line amounts must not be negative",
                                line.account_code);
    }
    if ((line.debit == 0) == (line.credit == 0)) {
      return make_posting_error(posting_error_code::invalid_line,
                                "exactly one of debit or credit must be set",
                                line.account_code);
    }
    if (auto postable = directory_.check_postable(line.account_code);
        !postable.ok()) {
      return postable;
    }
    auto account = directory_.lookup(line.account_code);
    if (!account) {
      return make_posting_error(posting_error_code::account_missing,
                                "account does not exist", line.account_code);
    }

    auto debit = tally::schema::checked_add(total_debit, line.debit);
    auto credit = tally::schema::checked_add(total_credit, line.credit);
    if (!debit || !credit) {
      return make_posting_error(posting_error_code::invalid_amount,
                                "entry total overflows");
    }
    total_debit = *debit;
    total_credit = *credit;

    auto resolved = journal_line_t{};
    resolved.account_id = account->id;
    resolved.debit = line.debit;
    resolved.credit = line.credit;
    resolved.description = line.description;
    out.lines.push_back(std::move(resolved));
  }

  if (total_debit != total_credit) {
    return make_posting_error(
        posting_error_code::unbalanced_entry, "debits must equal credits",
        fmt::format("debit {} credit {}",
                    tally::schema::format_amount(total_debit),
                    tally::schema::format_amount(total_credit)));
  }

  out.entry = journal_entry_t{};
  out.entry.entry_date = proposal.entry_date;
  out.entry.description = proposal.description;
  out.entry.source_type = proposal.source_type;
  out.entry.source_id = proposal.source_id;
  out.entry.purpose = proposal.purpose;
  out.entry.total_debit = total_debit;
  out.entry.total_credit = total_credit;
  out.entry.content_hash = tally::ledger::content_fingerprint(out.lines);
  return accepted();
}

posting_result_t engine::post(const journal_entry_proposal_t& proposal) {
  auto resolved = resolved_proposal{};
  if (auto rejected = resolve(proposal, resolved); !rejected.ok()) {
    spdlog::warn("Rejected post {}: {} ({}) {}", describe(proposal),
                 tally::schema::to_string(rejected.error()), rejected.log,
                 rejected.info);
    return rejected;
  }

  auto result = posting_result_t{};
  try {
    result = ledger_.append(resolved.entry, resolved.lines);
  } catch (const tally::storage::storage_error& e) {
    return storage_failure(e);
  }
  if (!result.ok()) {
    spdlog::warn("Ledger rejected post {}: {}", describe(proposal), result.log);
    return result;
  }

  if (result.replayed) {
    if (result.entry->content_hash != resolved.entry.content_hash) {
      auto warning = tally::schema::make_warning(
          consistency_warning_type_t::idempotent_content_mismatch,
          consistency_warning_severity_t::warning, std::nullopt,
          result.entry->total_debit, resolved.entry.total_debit,
          fmt::format("replay of {} carries different lines than {}",
                      describe(proposal), result.entry->entry_number));
      warning.entry_id = result.entry->id;
      queue(std::move(warning));
    }
    return result;
  }

  propagate(*result.entry, result.lines);
  return result;
}

posting_result_t engine::draft(const journal_entry_proposal_t& proposal) {
  auto resolved = resolved_proposal{};
  if (auto rejected = resolve(proposal, resolved); !rejected.ok()) {
    spdlog::warn("Rejected draft {}: {} ({})", describe(proposal),
                 tally::schema::to_string(rejected.error()), rejected.log);
    return rejected;
  }
  try {
    return ledger_.save_draft(resolved.entry, resolved.lines);
  } catch (const tally::storage::storage_error& e) {
    return storage_failure(e);
  }
}

posting_result_t engine::post_draft(const tally::schema::entry_id_t entry_id) {
  auto result = posting_result_t{};
  try {
    auto draft = ledger_.find(entry_id);
    if (draft && draft->status == tally::schema::entry_status_t::draft) {
      if (auto date = check_date(draft->entry_date); !date.ok()) {
        spdlog::warn("Rejected draft promotion of {}: {}", draft->entry_number,
                     date.log);
        return date;
      }
      for (const auto& line : ledger_.lines(entry_id)) {
        auto account = directory_.find(line.account_id);
        auto postable =
            account ? directory_.check_postable(account->code)
                    : make_posting_error(posting_error_code::account_missing,
                                         "account does not exist",
                                         std::to_string(line.account_id));
        if (!postable.ok()) {
          spdlog::warn("Rejected draft promotion of {}: {}",
                       draft->entry_number, postable.log);
          return postable;
        }
      }
    }
    result = ledger_.promote_draft(entry_id);
  } catch (const tally::storage::storage_error& e) {
    return storage_failure(e);
  }
  if (result.ok() && !result.replayed) {
    propagate(*result.entry, result.lines);
  }
  return result;
}

posting_result_t engine::void_entry(const tally::schema::entry_id_t entry_id,
                                    const std::string_view reason,
                                    const tally::schema::calendar_date_t date) {
  if (reason.empty()) {
    return make_posting_error(posting_error_code::invalid_proposal,
                              "a void needs a reason");
  }

  auto result = posting_result_t{};
  try {
    auto original = ledger_.find(entry_id);
    if (original && original->status == tally::schema::entry_status_t::posted) {
      auto effective = date == 0 ? original->entry_date : date;
      if (auto checked = check_date(effective); !checked.ok()) {
        spdlog::warn("Rejected void of {}: {}", original->entry_number,
                     checked.log);
        return checked;
      }
    }
    result = ledger_.void_entry(entry_id, reason, date);
  } catch (const tally::storage::storage_error& e) {
    return storage_failure(e);
  }
  if (!result.ok()) {
    spdlog::warn("Void of entry {} rejected: {}", entry_id, result.log);
    return result;
  }
  if (!result.replayed) {
    propagate(*result.entry, result.lines);
  }
  return result;
}

void engine::propagate(const journal_entry_t& entry,
                       const std::vector<journal_line_t>& lines) {
  auto touched = std::vector<tally::schema::account_id_t>{};
  {
    auto distinct = std::set<tally::schema::account_id_t>{};
    for (const auto& line : lines) {
      if (distinct.insert(line.account_id).second) {
        touched.push_back(line.account_id);
      }
    }
  }

  try {
    projector_.project_touched(touched);
  } catch (const std::exception& e) {
    spdlog::error("Projection after {} failed: {}", entry.entry_number,
                  e.what());
    auto warning = tally::schema::make_warning(
        consistency_warning_type_t::projection_failed,
        consistency_warning_severity_t::error, std::nullopt, 0, 0,
        fmt::format("projection after {} failed: {}", entry.entry_number,
                    e.what()));
    warning.entry_id = entry.id;
    queue(std::move(warning));
    return;
  }

  for (const auto account_id : touched) {
    try {
      mirrors_.refresh(account_id);
    } catch (const std::exception& e) {
      spdlog::error("Mirror refresh of account {} after {} failed: {}",
                    account_id, entry.entry_number, e.what());
      auto warning = tally::schema::make_warning(
          consistency_warning_type_t::mirror_write_failed,
          consistency_warning_severity_t::error, account_id, 0, 0,
          fmt::format("mirror refresh after {} failed: {}", entry.entry_number,
                      e.what()));
      warning.entry_id = entry.id;
      queue(std::move(warning));
    }
  }
}

void engine::queue(tally::schema::consistency_warning_t warning) {
  try {
    warnings_.record(std::move(warning));
  } catch (const tally::storage::storage_error& e) {
    spdlog::error("Failed to queue consistency warning: {}", e.what());
  }
}

}  // namespace tally::posting
