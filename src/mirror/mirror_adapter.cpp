#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/schema/amount.hpp>
#include <exception>

namespace tally::mirror {

mirror_adapter::mirror_adapter(
    const tally::projection::balance_projector& projector)
    : projector_{projector} {}

void mirror_adapter::add_target(mirror_target& target) {
  targets_.push_back(&target);
}

tally::schema::account_balance_t mirror_adapter::projected(
    const tally::schema::account_id_t account_id) const {
  auto balance = projector_.balance(account_id);
  if (balance) {
    return *balance;
  }
  auto empty = tally::schema::account_balance_t{};
  empty.account_id = account_id;
  return empty;
}

std::vector<tally::schema::mirror_balance_t> mirror_adapter::refresh(
    const tally::schema::account_id_t account_id) {
  auto out = std::vector<tally::schema::mirror_balance_t>{};
  auto balance = projected(account_id);
  for (auto* target : targets_) {
    if (!target->mirrors(account_id)) {
      continue;
    }
    auto refreshed = target->refresh(account_id, balance);
    out.insert(std::end(out), std::begin(refreshed), std::end(refreshed));
  }
  return out;
}

bool mirror_adapter::validate(
    const tally::schema::account_id_t account_id) const {
  auto expected = projected(account_id).balance;
  for (const auto* target : targets_) {
    for (const auto& mirrored : target->read(account_id)) {
      if (mirrored.balance != expected) {
        return false;
      }
    }
  }
  return true;
}

sweep_report mirror_adapter::sweep(const std::atomic<bool>& stop) {
  using tally::schema::consistency_warning_severity_t;
  using tally::schema::consistency_warning_type_t;

  auto report = sweep_report{};
  for (auto* target : targets_) {
    for (const auto account_id : target->mirrored_accounts()) {
      if (stop.load()) {
        report.interrupted = true;
        spdlog::info("Mirror sweep interrupted after {} accounts",
                     report.accounts_checked);
        return report;
      }
      ++report.accounts_checked;

      auto expected = projected(account_id);
      auto diverged = false;
      for (const auto& mirrored : target->read(account_id)) {
        if (mirrored.balance == expected.balance) {
          continue;
        }
        diverged = true;
        report.warnings.push_back(tally::schema::make_warning(
            consistency_warning_type_t::mirror_mismatch,
            consistency_warning_severity_t::warning, account_id,
            expected.balance, mirrored.balance,
            fmt::format("{} record {} holds {}, ledger holds {}",
                        target->kind(), mirrored.record_id,
                        tally::schema::format_amount(mirrored.balance),
                        tally::schema::format_amount(expected.balance))));
        spdlog::warn("Mirror mismatch: {}", report.warnings.back().message);
      }
      if (!diverged) {
        continue;
      }

      try {
        target->refresh(account_id, expected);
        ++report.refreshed;
      } catch (const std::exception& e) {
        spdlog::error("Mirror refresh of account {} failed: {}", account_id,
                      e.what());
        report.warnings.push_back(tally::schema::make_warning(
            consistency_warning_type_t::mirror_write_failed,
            consistency_warning_severity_t::error, account_id,
            expected.balance, 0,
            fmt::format("{} refresh failed: {}", target->kind(), e.what())));
      }
    }
  }
  return report;
}

}  // namespace tally::mirror
