#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/reconciliation/reconciler.hpp>
#include <tally/schema/amount.hpp>
#include <map>
#include <set>
#include <utility>

namespace tally::reconciliation {

namespace {

using tally::schema::account_class_t;
using tally::schema::account_id_t;
using tally::schema::amount_t;
using tally::schema::consistency_warning_severity_t;
using tally::schema::consistency_warning_t;
using tally::schema::consistency_warning_type_t;

using condition_t =
    std::pair<consistency_warning_type_t, std::optional<account_id_t>>;

bool is_mirror_condition(const consistency_warning_type_t type) {
  return type == consistency_warning_type_t::mirror_mismatch ||
         type == consistency_warning_type_t::mirror_write_failed;
}

/// assets == liabilities + equity + revenue - expense, over leaf balances in
/// their normal-balance convention. Returns (assets, right-hand side) or
/// nothing on overflow.
std::optional<std::pair<amount_t, amount_t>> accounting_equation(
    const tally::directory::account_directory& directory,
    const std::map<account_id_t, tally::schema::account_balance_t>& balances) {
  auto totals = std::map<account_class_t, amount_t>{};
  for (const auto& account : directory.all()) {
    if (account.is_header) {
      continue;
    }
    auto it = balances.find(account.id);
    if (it == std::end(balances)) {
      continue;
    }
    auto sum = tally::schema::checked_add(totals[account.account_class],
                                          it->second.balance);
    if (!sum) {
      return std::nullopt;
    }
    totals[account.account_class] = *sum;
  }
  auto rhs = tally::schema::checked_add(totals[account_class_t::liability],
                                        totals[account_class_t::equity]);
  if (rhs) {
    rhs = tally::schema::checked_add(*rhs, totals[account_class_t::revenue]);
  }
  if (rhs) {
    rhs =
        tally::schema::checked_subtract(*rhs, totals[account_class_t::expense]);
  }
  if (!rhs) {
    return std::nullopt;
  }
  return std::pair{totals[account_class_t::asset], *rhs};
}

}  // namespace

reconciler::reconciler(const tally::directory::account_directory& directory,
                       const tally::ledger::ledger_store& ledger,
                       tally::projection::balance_projector& projector,
                       tally::mirror::mirror_adapter& mirrors,
                       warning_log& warnings,
                       reconciler_options options)
    : directory_{directory},
      ledger_{ledger},
      projector_{projector},
      mirrors_{mirrors},
      warnings_{warnings},
      options_{options} {}

reconciliation_report reconciler::reconcile() {
  auto never = std::atomic<bool>{false};
  return reconcile(never);
}

reconciliation_report reconciler::reconcile(const std::atomic<bool>& stop) {
  auto report = reconciliation_report{};
  auto lock = std::unique_lock{running_, std::try_to_lock};
  if (!lock.owns_lock()) {
    spdlog::info("Reconciliation already running; skipping");
    report.skipped = true;
    return report;
  }
  report.started_at = tally::schema::now_milliseconds();
  spdlog::info("Reconciliation started");

  auto queued = warnings_.pending();

  auto rebuild = projector_.rematerialize();
  report.accounts_rebuilt = rebuild.accounts_rebuilt;
  report.repaired.insert(std::end(report.repaired),
                         std::begin(rebuild.drifts), std::end(rebuild.drifts));

  auto rollups = projector_.verify_rollups();
  report.outstanding.insert(std::end(report.outstanding), std::begin(rollups),
                            std::end(rollups));

  auto mirrors_checked = false;
  if (stop.load()) {
    report.interrupted = true;
  } else if (options_.sweep_mirrors) {
    auto sweep = mirrors_.sweep(stop);
    report.mirrors_refreshed = sweep.refreshed;
    report.interrupted = sweep.interrupted;
    mirrors_checked = !sweep.interrupted;

    auto failed = std::set<std::optional<account_id_t>>{};
    for (const auto& warning : sweep.warnings) {
      if (warning.type == consistency_warning_type_t::mirror_write_failed) {
        failed.insert(warning.account_id);
      }
    }
    for (auto& warning : sweep.warnings) {
      if (failed.contains(warning.account_id)) {
        report.outstanding.push_back(std::move(warning));
      } else {
        report.repaired.push_back(std::move(warning));
      }
    }
  }

  report.trial_balance = ledger_.trial_balance();
  if (!report.trial_balance.balanced()) {
    report.outstanding.push_back(tally::schema::make_warning(
        consistency_warning_type_t::trial_balance_mismatch,
        consistency_warning_severity_t::critical, std::nullopt,
        report.trial_balance.total_debit, report.trial_balance.total_credit,
        fmt::format("posted debits {} differ from posted credits {}",
                    tally::schema::format_amount(
                        report.trial_balance.total_debit),
                    tally::schema::format_amount(
                        report.trial_balance.total_credit))));
  }

  auto equation = accounting_equation(directory_, rebuild.balances);
  report.equation_holds = equation && equation->first == equation->second;
  if (!report.equation_holds) {
    auto assets = equation ? equation->first : amount_t{0};
    auto rhs = equation ? equation->second : amount_t{0};
    report.outstanding.push_back(tally::schema::make_warning(
        consistency_warning_type_t::accounting_equation_mismatch,
        consistency_warning_severity_t::critical, std::nullopt, assets, rhs,
        equation ? fmt::format("assets {} != liabilities + equity + revenue - "
                               "expense {}",
                               tally::schema::format_amount(assets),
                               tally::schema::format_amount(rhs))
                 : std::string{"accounting equation overflows"}));
  }

  if (options_.validate_hierarchy) {
    auto findings = directory_.validate_hierarchy();
    report.outstanding.insert(std::end(report.outstanding),
                              std::begin(findings), std::end(findings));
  }

  auto resolved_ids = std::set<tally::schema::warning_id_t>{};
  for (auto& warning : report.repaired) {
    warning = warnings_.record(warning);
    if (warnings_.resolve(warning.id)) {
      warning.resolved = true;
      resolved_ids.insert(warning.id);
    }
  }
  auto still_holding = std::set<condition_t>{};
  for (auto& warning : report.outstanding) {
    warning = warnings_.record(warning);
    still_holding.insert(condition_t{warning.type, warning.account_id});
  }

  for (const auto& warning : queued) {
    if (warning.type ==
            consistency_warning_type_t::idempotent_content_mismatch ||
        (is_mirror_condition(warning.type) && !mirrors_checked) ||
        still_holding.contains(condition_t{warning.type, warning.account_id})) {
      continue;
    }
    if (warnings_.resolve(warning.id)) {
      resolved_ids.insert(warning.id);
    }
  }
  for (const auto& warning : queued) {
    report.resolved += resolved_ids.contains(warning.id) ? 1 : 0;
  }

  auto now = tally::schema::now_milliseconds();
  auto retention =
      static_cast<tally::schema::timestamp_milliseconds_t>(
          options_.resolved_retention.count());
  report.pruned = warnings_.prune_resolved(now > retention ? now - retention
                                                           : 0);

  report.finished_at = tally::schema::now_milliseconds();
  spdlog::info(
      "Reconciliation finished in {} ms: {} balances rebuilt, {} mirrors "
      "refreshed, {} repaired, {} outstanding, {} resolved, {} pruned",
      report.finished_at - report.started_at, report.accounts_rebuilt,
      report.mirrors_refreshed, report.repaired.size(),
      report.outstanding.size(), report.resolved, report.pruned);
  return report;
}

}  // namespace tally::reconciliation
