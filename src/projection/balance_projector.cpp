#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/projection/balance_projector.hpp>
#include <tally/schema/amount.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <set>

namespace tally::projection {

namespace {

using tally::schema::account_balance_t;
using tally::schema::account_id_t;
using tally::schema::account_t;
using tally::schema::amount_t;
using tally::schema::make_bytes_view;

amount_t require(const std::optional<amount_t>& value,
                 const account_t& account) {
  if (!value) {
    throw projection_error{
        fmt::format("balance of account {} overflows", account.code)};
  }
  return *value;
}

}  // namespace

amount_t display_balance(const account_t& account,
                         const account_balance_t& balance) {
  if (tally::schema::is_credit_normal(account.account_class)) {
    return balance.balance < 0 ? -balance.balance : balance.balance;
  }
  return balance.balance;
}

std::optional<amount_t> to_parent_sign(const account_t& parent,
                                       const account_t& child,
                                       const amount_t balance) {
  auto sign = tally::schema::normal_sign(parent.account_class) *
              tally::schema::normal_sign(child.account_class);
  return tally::schema::apply_sign(sign, balance);
}

balance_projector::balance_projector(
    storage_t& storage,
    const tally::directory::account_directory& directory,
    const tally::ledger::ledger_store& ledger)
    : storage_{storage}, directory_{directory}, ledger_{ledger} {}

account_balance_t balance_projector::compute_leaf(
    const account_t& account) const {
  auto out = account_balance_t{};
  out.account_id = account.id;
  auto cursor = ledger_.lines_for_account(account.id);
  while (auto line = cursor.next()) {
    out.total_debit = require(
        tally::schema::checked_add(out.total_debit, line->debit), account);
    out.total_credit = require(
        tally::schema::checked_add(out.total_credit, line->credit), account);
    out.last_entry_id = std::max(out.last_entry_id, line->entry_id);
    ++out.line_count;
  }
  auto net = require(
      tally::schema::checked_subtract(out.total_debit, out.total_credit),
      account);
  out.balance = require(
      tally::schema::apply_sign(
          tally::schema::normal_sign(account.account_class), net),
      account);
  out.projected_at = tally::schema::now_milliseconds();
  return out;
}

account_balance_t balance_projector::compute_header(
    const account_t& header,
    const std::vector<child_balance_t>& children) const {
  auto out = account_balance_t{};
  out.account_id = header.id;
  for (const auto& [child, balance] : children) {
    auto converted =
        require(to_parent_sign(header, child, balance.balance), header);
    out.balance =
        require(tally::schema::checked_add(out.balance, converted), header);
    out.total_debit = require(
        tally::schema::checked_add(out.total_debit, balance.total_debit),
        header);
    out.total_credit = require(
        tally::schema::checked_add(out.total_credit, balance.total_credit),
        header);
    out.line_count += balance.line_count;
    out.last_entry_id = std::max(out.last_entry_id, balance.last_entry_id);
  }
  out.projected_at = tally::schema::now_milliseconds();
  return out;
}

account_balance_t balance_projector::compute_locked(
    const account_t& account) const {
  if (!account.is_header) {
    return compute_leaf(account);
  }
  auto children = std::vector<child_balance_t>{};
  for (auto& child : directory_.children(account.id)) {
    auto cached = balance(child.id);
    auto child_balance = cached ? *cached : compute_locked(child);
    children.emplace_back(std::move(child), std::move(child_balance));
  }
  return compute_header(account, children);
}

account_balance_t balance_projector::store_locked(
    const account_balance_t& balance) {
  auto existing = this->balance(balance.account_id);
  if (existing && existing->last_entry_id > balance.last_entry_id) {
    spdlog::debug("Skipping stale projection of account {} ({} < {})",
                  balance.account_id, balance.last_entry_id,
                  existing->last_entry_id);
    return *existing;
  }
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_balance_key(balance.account_id);
  storage_.put(encoder, make_bytes_view(key), balance);
  return balance;
}

account_t balance_projector::require_account(
    const account_id_t account_id) const {
  auto account = directory_.find(account_id);
  if (!account) {
    throw projection_error{
        fmt::format("account {} does not exist", account_id)};
  }
  return *account;
}

account_balance_t balance_projector::project_locked(const account_t& account) {
  auto projected = store_locked(compute_locked(account));
  spdlog::debug("Projected account {} balance {}", account.code,
                tally::schema::format_amount(projected.balance));
  return projected;
}

account_balance_t balance_projector::project_account(
    const account_id_t account_id) {
  auto account = require_account(account_id);
  auto lock = std::lock_guard{mutex_};
  return project_locked(account);
}

std::vector<account_balance_t> balance_projector::project_ancestors(
    const account_id_t account_id) {
  auto ancestors = directory_.ancestors(account_id);
  auto out = std::vector<account_balance_t>{};
  auto lock = std::lock_guard{mutex_};
  for (const auto& ancestor : ancestors) {
    out.push_back(project_locked(ancestor));
  }
  return out;
}

std::vector<account_balance_t> balance_projector::project_touched(
    const std::vector<account_id_t>& account_ids) {
  auto touched = std::set<account_id_t>{std::begin(account_ids),
                                        std::end(account_ids)};
  auto leaves = std::vector<account_t>{};
  for (const auto id : touched) {
    leaves.push_back(require_account(id));
  }

  // depth -> ancestors at that depth; walked from the deepest level up so a
  // parent always sees its children's new balances.
  auto levels = std::map<uint32_t, std::set<account_id_t>>{};
  for (const auto id : touched) {
    auto ancestors = directory_.ancestors(id);
    auto depth = static_cast<uint32_t>(ancestors.size());
    for (const auto& ancestor : ancestors) {
      --depth;
      if (!touched.contains(ancestor.id)) {
        levels[depth].insert(ancestor.id);
      }
    }
  }

  auto out = std::vector<account_balance_t>{};
  auto lock = std::lock_guard{mutex_};
  for (const auto& leaf : leaves) {
    out.push_back(project_locked(leaf));
  }
  for (auto level = levels.rbegin(); level != levels.rend(); ++level) {
    for (const auto id : level->second) {
      out.push_back(project_locked(require_account(id)));
    }
  }
  return out;
}

std::optional<account_balance_t> balance_projector::balance(
    const account_id_t account_id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_balance_key(account_id);
  return storage_.get<account_balance_t>(encoder, make_bytes_view(key));
}

rebuild_report balance_projector::rematerialize() {
  auto lock = std::lock_guard{mutex_};
  auto report = rebuild_report{};

  auto accounts = directory_.all();
  auto depths = std::map<account_id_t, uint32_t>{};
  for (const auto& account : accounts) {
    depths[account.id] = directory_.depth(account.id);
  }
  std::ranges::stable_sort(accounts, [&](const auto& lhs, const auto& rhs) {
    return depths[lhs.id] > depths[rhs.id];
  });

  for (const auto& account : accounts) {
    if (!account.is_header) {
      report.balances[account.id] = compute_leaf(account);
      continue;
    }
    auto children = std::vector<child_balance_t>{};
    for (auto& child : directory_.children(account.id)) {
      auto it = report.balances.find(child.id);
      auto child_balance =
          it != std::end(report.balances) ? it->second : compute_leaf(child);
      children.emplace_back(std::move(child), std::move(child_balance));
    }
    report.balances[account.id] = compute_header(account, children);
  }

  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kBalancePrefix);
  auto previous = std::map<account_id_t, account_balance_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto cached =
        encoder.try_decode_record<account_balance_t>(make_bytes_view(value));
    if (cached) {
      previous[cached->account_id] = *cached;
    }
  }

  auto entries = std::vector<tally::storage::key_value_entry_t>{};
  for (const auto& account : accounts) {
    const auto& rebuilt = report.balances.at(account.id);
    auto it = previous.find(account.id);
    auto cached = it != std::end(previous) ? std::optional{it->second}
                                           : std::nullopt;
    if ((cached && cached->balance != rebuilt.balance) ||
        (!cached && rebuilt.balance != 0)) {
      auto actual = cached ? cached->balance : amount_t{0};
      report.drifts.push_back(tally::schema::make_warning(
          tally::schema::consistency_warning_type_t::balance_drift,
          tally::schema::consistency_warning_severity_t::warning, account.id,
          rebuilt.balance, actual,
          fmt::format("cached balance of {} was {}, ledger gives {}",
                      account.code, tally::schema::format_amount(actual),
                      tally::schema::format_amount(rebuilt.balance))));
      spdlog::warn("Balance drift on {}: cached {} rebuilt {}", account.code,
                   tally::schema::format_amount(actual),
                   tally::schema::format_amount(rebuilt.balance));
    }
    entries.emplace_back(tally::schema::key::make_balance_key(account.id),
                         encoder.encode_record(rebuilt));
  }

  storage_.replace_by_prefix(make_bytes_view(prefix), entries);
  report.accounts_rebuilt = entries.size();
  spdlog::info("Rematerialized {} balances, {} drifted",
               report.accounts_rebuilt, report.drifts.size());
  return report;
}

std::vector<tally::schema::consistency_warning_t>
balance_projector::verify_rollups() const {
  auto lock = std::lock_guard{mutex_};
  auto warnings = std::vector<tally::schema::consistency_warning_t>{};
  for (const auto& header : directory_.all()) {
    if (!header.is_header) {
      continue;
    }
    auto live = amount_t{0};
    auto overflowed = false;
    for (const auto& child : directory_.children(header.id)) {
      auto cached = balance(child.id);
      if (!cached) {
        continue;
      }
      auto converted = to_parent_sign(header, child, cached->balance);
      auto sum = converted ? tally::schema::checked_add(live, *converted)
                           : std::nullopt;
      if (!sum) {
        overflowed = true;
        break;
      }
      live = *sum;
    }
    auto stored = balance(header.id);
    auto actual = stored ? stored->balance : amount_t{0};
    if (!overflowed && live == actual) {
      continue;
    }
    warnings.push_back(tally::schema::make_warning(
        tally::schema::consistency_warning_type_t::rollup_mismatch,
        tally::schema::consistency_warning_severity_t::error, header.id, live,
        actual,
        fmt::format("header {} caches {} but its children sum to {}",
                    header.code, tally::schema::format_amount(actual),
                    overflowed ? std::string{"an overflowing amount"}
                               : tally::schema::format_amount(live))));
    spdlog::warn("Rollup mismatch on {}", header.code);
  }
  return warnings;
}

}  // namespace tally::projection
