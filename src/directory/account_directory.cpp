#include <spdlog/spdlog.h>
#include <tally/directory/account_directory.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <spdlog/fmt/fmt.h>
#include <set>

namespace tally::directory {

namespace {

using tally::schema::account_id_t;
using tally::schema::account_t;
using tally::schema::posting_error_code;
using tally::schema::posting_result_t;

posting_result_t make_directory_error(const posting_error_code code,
                                      std::string log,
                                      std::string info = {}) {
  return tally::schema::make_error(code, std::move(log), std::move(info),
                                   std::string{kCodespace});
}

bool same_definition(const account_t& account,
                     const tally::schema::account_definition& definition,
                     const std::optional<account_id_t>& parent_id) {
  return account.name == definition.name &&
         account.account_class == definition.account_class &&
         account.is_header == definition.is_header &&
         account.parent_id == parent_id;
}

tally::schema::consistency_warning_t make_hierarchy_warning(
    const account_t& account,
    const tally::schema::consistency_warning_severity_t severity,
    std::string message) {
  return tally::schema::make_warning(
      tally::schema::consistency_warning_type_t::hierarchy_invalid, severity,
      account.id, 0, 0, std::move(message));
}

}  // namespace

account_directory::account_directory(storage_t& storage) : storage_{storage} {
  auto encoder = encoder_t{};
  auto prefix = tally::schema::key::make_prefix(
      tally::schema::key::kAccountPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(tally::schema::make_bytes_view(prefix))) {
    auto account = encoder.try_decode_record<account_t>(
        tally::schema::make_bytes_view(value));
    if (!account) {
      spdlog::error("Skipping undecodable account record {}",
                    tally::schema::to_hex(tally::schema::make_bytes_view(key)));
      continue;
    }
    codes_[account->code] = account->id;
    accounts_[account->id] = std::move(*account);
  }
  spdlog::debug("Loaded {} accounts", accounts_.size());
}

std::optional<account_t> account_directory::lookup(
    const std::string_view code) const {
  auto lock = std::shared_lock{mutex_};
  auto account = find_by_code_locked(code);
  if (!account || !account->active) {
    return std::nullopt;
  }
  return account;
}

std::optional<account_t> account_directory::find(const account_id_t id) const {
  auto lock = std::shared_lock{mutex_};
  return find_locked(id);
}

std::optional<account_t> account_directory::find_by_code(
    const std::string_view code) const {
  auto lock = std::shared_lock{mutex_};
  return find_by_code_locked(code);
}

std::optional<account_t> account_directory::find_locked(
    const account_id_t id) const {
  auto it = accounts_.find(id);
  if (it == std::end(accounts_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<account_t> account_directory::find_by_code_locked(
    const std::string_view code) const {
  auto it = codes_.find(code);
  if (it == std::end(codes_)) {
    return std::nullopt;
  }
  return find_locked(it->second);
}

std::vector<account_t> account_directory::children(
    const account_id_t id) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<account_t>{};
  // codes_ is ordered, so the result comes out ordered by code.
  for (const auto& [code, child_id] : codes_) {
    const auto& account = accounts_.at(child_id);
    if (account.parent_id == id) {
      out.push_back(account);
    }
  }
  return out;
}

std::vector<account_t> account_directory::ancestors(
    const account_id_t id) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<account_t>{};
  auto seen = std::set<account_id_t>{id};
  auto current = find_locked(id);
  while (current && current->parent_id) {
    if (!seen.insert(*current->parent_id).second) {
      spdlog::warn("Account hierarchy cycle at account {}", current->code);
      break;
    }
    current = find_locked(*current->parent_id);
    if (current) {
      out.push_back(*current);
    }
  }
  return out;
}

bool account_directory::is_header(const account_id_t id) const {
  auto account = find(id);
  return account.has_value() && account->is_header;
}

uint32_t account_directory::depth(const account_id_t id) const {
  return static_cast<uint32_t>(ancestors(id).size());
}

posting_result_t account_directory::check_postable(
    const std::string_view code) const {
  auto account = find_by_code(code);
  if (!account) {
    return make_directory_error(posting_error_code::account_missing,
                                "account does not exist", std::string{code});
  }
  if (!account->active) {
    return make_directory_error(posting_error_code::account_inactive,
                                "account is retired", std::string{code});
  }
  if (account->is_header) {
    return make_directory_error(posting_error_code::header_account,
                                "header accounts only aggregate children",
                                std::string{code});
  }
  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  return result;
}

posting_result_t account_directory::define(
    const tally::schema::account_definition& definition) {
  if (definition.code.empty() || definition.name.empty()) {
    return make_directory_error(posting_error_code::invalid_proposal,
                                "account code and name are required",
                                definition.code);
  }

  auto lock = std::unique_lock{mutex_};

  auto parent_id = std::optional<account_id_t>{};
  if (definition.parent_code) {
    auto parent = find_by_code_locked(*definition.parent_code);
    if (!parent) {
      return make_directory_error(posting_error_code::parent_missing,
                                  "parent account does not exist",
                                  *definition.parent_code);
    }
    if (!parent->is_header) {
      return make_directory_error(posting_error_code::parent_not_header,
                                  "parent account must be a header",
                                  *definition.parent_code);
    }
    if (parent->account_class != definition.account_class) {
      return make_directory_error(
          posting_error_code::class_mismatch,
          "account class must match the parent's class",
          fmt::format("{} is {}, parent {} is {}", definition.code,
                      tally::schema::to_string(definition.account_class),
                      parent->code,
                      tally::schema::to_string(parent->account_class)));
    }
    parent_id = parent->id;
  }

  if (auto existing = find_by_code_locked(definition.code)) {
    if (same_definition(*existing, definition, parent_id)) {
      auto result = posting_result_t{};
      result.codespace = std::string{kCodespace};
      result.replayed = true;
      return result;
    }
    return make_directory_error(posting_error_code::account_conflict,
                                "account code already defined differently",
                                definition.code);
  }

  auto encoder = encoder_t{};
  auto account = account_t{};
  account.code = definition.code;
  account.name = definition.name;
  account.account_class = definition.account_class;
  account.is_header = definition.is_header;
  account.parent_id = parent_id;

  try {
    auto txn = storage_.begin();
    auto code_key = tally::schema::key::make_account_code_key(account.code);
    if (txn.get_for_update(tally::schema::make_bytes_view(code_key))) {
      return make_directory_error(posting_error_code::account_conflict,
                                  "account code was defined concurrently",
                                  definition.code);
    }
    account.id =
        txn.next_sequence(encoder, tally::schema::key::kAccountSequenceKey);
    auto encoded_id = encoder.encode(account.id);
    txn.put(tally::schema::make_bytes_view(code_key),
            tally::schema::make_bytes_view(encoded_id));
    auto account_key = tally::schema::key::make_account_key(account.id);
    auto encoded = encoder.encode_record(account);
    txn.put(tally::schema::make_bytes_view(account_key),
            tally::schema::make_bytes_view(encoded));
    txn.commit();
  } catch (const tally::storage::storage_error& e) {
    return make_directory_error(posting_error_code::storage_failure,
                                "failed to persist account", e.what());
  }

  spdlog::info("Defined account {} '{}' ({})", account.code, account.name,
               tally::schema::to_string(account.account_class));
  codes_[account.code] = account.id;
  accounts_[account.id] = account;

  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  return result;
}

posting_result_t account_directory::retire(const std::string_view code) {
  auto lock = std::unique_lock{mutex_};
  auto account = find_by_code_locked(code);
  if (!account) {
    return make_directory_error(posting_error_code::account_missing,
                                "account does not exist", std::string{code});
  }
  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  if (!account->active) {
    result.replayed = true;
    return result;
  }
  account->active = false;
  try {
    persist(*account);
  } catch (const tally::storage::storage_error& e) {
    return make_directory_error(posting_error_code::storage_failure,
                                "failed to persist account", e.what());
  }
  accounts_[account->id] = *account;
  spdlog::info("Retired account {}", account->code);
  return result;
}

void account_directory::persist(const account_t& account) {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_account_key(account.id);
  storage_.put(encoder, tally::schema::make_bytes_view(key), account);
}

std::vector<account_t> account_directory::all() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<account_t>{};
  out.reserve(accounts_.size());
  for (const auto& [code, id] : codes_) {
    out.push_back(accounts_.at(id));
  }
  return out;
}

std::vector<tally::schema::consistency_warning_t>
account_directory::validate_hierarchy() const {
  using severity_t = tally::schema::consistency_warning_severity_t;

  auto lock = std::shared_lock{mutex_};
  auto warnings = std::vector<tally::schema::consistency_warning_t>{};
  auto child_counts = std::map<account_id_t, std::size_t>{};

  for (const auto& [id, account] : accounts_) {
    if (!account.parent_id) {
      continue;
    }
    ++child_counts[*account.parent_id];
    auto parent = find_locked(*account.parent_id);
    if (!parent) {
      warnings.push_back(make_hierarchy_warning(
          account, severity_t::error,
          fmt::format("account {} references missing parent {}", account.code,
                      *account.parent_id)));
      continue;
    }
    if (!parent->is_header) {
      warnings.push_back(make_hierarchy_warning(
          account, severity_t::error,
          fmt::format("account {} has non-header parent {}", account.code,
                      parent->code)));
    }
    if (parent->account_class != account.account_class) {
      warnings.push_back(make_hierarchy_warning(
          account, severity_t::error,
          fmt::format("account {} is {} but parent {} is {}", account.code,
                      tally::schema::to_string(account.account_class),
                      parent->code,
                      tally::schema::to_string(parent->account_class))));
    }

    auto seen = std::set<account_id_t>{id};
    auto current = parent;
    while (current) {
      if (!seen.insert(current->id).second) {
        warnings.push_back(make_hierarchy_warning(
            account, severity_t::critical,
            fmt::format("account {} is part of a parent cycle",
                        account.code)));
        break;
      }
      current = current->parent_id ? find_locked(*current->parent_id)
                                   : std::nullopt;
    }
  }

  for (const auto& [id, account] : accounts_) {
    if (account.is_header && account.active && !child_counts.contains(id)) {
      warnings.push_back(make_hierarchy_warning(
          account, severity_t::info,
          fmt::format("header account {} has no children", account.code)));
    }
  }

  for (const auto& warning : warnings) {
    spdlog::warn("Hierarchy: {}", warning.message);
  }
  return warnings;
}

std::vector<tally::schema::account_definition> default_chart() {
  using tally::schema::account_class_t;
  auto header = [](std::string code, std::string name, account_class_t cls,
                   std::optional<std::string> parent = std::nullopt) {
    return tally::schema::account_definition{std::move(code), std::move(name),
                                             cls, true, std::move(parent)};
  };
  auto leaf = [](std::string code, std::string name, account_class_t cls,
                 std::string parent) {
    return tally::schema::account_definition{std::move(code), std::move(name),
                                             cls, false, std::move(parent)};
  };

  return {
      header("1000", "ASSETS", account_class_t::asset),
      header("1100", "CURRENT ASSETS", account_class_t::asset, "1000"),
      leaf("1101", "CASH", account_class_t::asset, "1100"),
      leaf("1102", "BANK", account_class_t::asset, "1100"),
      leaf("1240", "VAT INPUT", account_class_t::asset, "1100"),
      leaf("1301", "MERCHANDISE INVENTORY", account_class_t::asset, "1100"),
      header("1200", "ACCOUNTS RECEIVABLE", account_class_t::asset, "1000"),
      leaf("1201", "TRADE RECEIVABLES", account_class_t::asset, "1200"),
      header("1500", "FIXED ASSETS", account_class_t::asset, "1000"),
      leaf("1501", "OFFICE EQUIPMENT", account_class_t::asset, "1500"),
      leaf("1502", "VEHICLES", account_class_t::asset, "1500"),
      leaf("1503", "BUILDINGS", account_class_t::asset, "1500"),
      header("2000", "LIABILITIES", account_class_t::liability),
      header("2100", "CURRENT LIABILITIES", account_class_t::liability,
             "2000"),
      leaf("2101", "ACCOUNTS PAYABLE", account_class_t::liability, "2100"),
      leaf("2103", "VAT OUTPUT", account_class_t::liability, "2100"),
      leaf("2104", "WITHHOLDING TAX PAYABLE", account_class_t::liability,
           "2100"),
      header("3000", "EQUITY", account_class_t::equity),
      leaf("3101", "OWNER CAPITAL", account_class_t::equity, "3000"),
      leaf("3201", "RETAINED EARNINGS", account_class_t::equity, "3000"),
      header("4000", "REVENUE", account_class_t::revenue),
      leaf("4101", "SALES REVENUE", account_class_t::revenue, "4000"),
      leaf("4102", "SERVICE REVENUE", account_class_t::revenue, "4000"),
      leaf("4201", "OTHER INCOME", account_class_t::revenue, "4000"),
      header("5000", "EXPENSES", account_class_t::expense),
      leaf("5101", "COST OF GOODS SOLD", account_class_t::expense, "5000"),
      leaf("5201", "SALARIES EXPENSE", account_class_t::expense, "5000"),
      leaf("5202", "ELECTRICITY EXPENSE", account_class_t::expense, "5000"),
      leaf("5203", "TELEPHONE EXPENSE", account_class_t::expense, "5000"),
      leaf("5204", "TRANSPORTATION EXPENSE", account_class_t::expense, "5000"),
      leaf("5900", "GENERAL EXPENSE", account_class_t::expense, "5000"),
  };
}

posting_result_t seed(
    account_directory& directory,
    const std::vector<tally::schema::account_definition>& chart) {
  for (const auto& definition : chart) {
    auto result = directory.define(definition);
    if (!result.ok()) {
      spdlog::error("Failed seeding account {}: {}", definition.code,
                    result.log);
      return result;
    }
  }
  auto result = posting_result_t{};
  result.codespace = std::string{kCodespace};
  return result;
}

}  // namespace tally::directory
