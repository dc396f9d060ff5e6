#include <spdlog/spdlog.h>
#include <tally/reconciliation/warning_log.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <algorithm>

namespace tally::reconciliation {

namespace {

using tally::schema::consistency_warning_t;
using tally::schema::make_bytes_view;

tally::schema::bytes_t make_open_key(const consistency_warning_t& warning) {
  return tally::schema::key::make_warning_open_key(
      static_cast<uint8_t>(warning.type), warning.account_id,
      warning.entry_id);
}

consistency_warning_t decode_warning(encoder_t& encoder,
                                     const tally::schema::bytes_t& raw) {
  auto warning =
      encoder.try_decode_record<consistency_warning_t>(make_bytes_view(raw));
  if (!warning) {
    throw tally::storage::storage_error{"corrupt consistency warning"};
  }
  return std::move(*warning);
}

}  // namespace

warning_log::warning_log(storage_t& storage) : storage_{storage} {}

consistency_warning_t warning_log::record(consistency_warning_t warning) {
  auto lock = std::lock_guard{mutex_};
  auto encoder = encoder_t{};

  auto txn = storage_.begin();
  auto open_key = make_open_key(warning);
  if (auto raw = txn.get_for_update(make_bytes_view(open_key))) {
    auto id = encoder.try_decode<tally::schema::warning_id_t>(
        make_bytes_view(*raw));
    if (!id) {
      throw tally::storage::storage_error{"corrupt pending-warning index"};
    }
    warning.id = *id;
  } else {
    warning.id =
        txn.next_sequence(encoder, tally::schema::key::kWarningSequenceKey);
    auto encoded_id = encoder.encode(warning.id);
    txn.put(make_bytes_view(open_key), make_bytes_view(encoded_id));
  }
  warning.resolved = false;
  warning.resolved_at = 0;
  if (warning.recorded_at == 0) {
    warning.recorded_at = tally::schema::now_milliseconds();
  }
  auto key = tally::schema::key::make_warning_key(warning.id);
  auto encoded = encoder.encode_record(warning);
  txn.put(make_bytes_view(key), make_bytes_view(encoded));
  txn.commit();

  spdlog::warn("Consistency warning #{} [{}/{}]: {}", warning.id,
               tally::schema::to_string(warning.type),
               tally::schema::to_string(warning.severity), warning.message);
  return warning;
}

std::vector<consistency_warning_t> warning_log::pending() const {
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kWarningOpenPrefix);
  auto out = std::vector<consistency_warning_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto id =
        encoder.try_decode<tally::schema::warning_id_t>(make_bytes_view(value));
    if (!id) {
      throw tally::storage::storage_error{"corrupt pending-warning index"};
    }
    auto warning = find(*id);
    if (!warning) {
      throw tally::storage::storage_error{
          "pending-warning index names a missing warning"};
    }
    out.push_back(std::move(*warning));
  }
  std::ranges::sort(out, {}, &consistency_warning_t::id);
  return out;
}

std::vector<consistency_warning_t> warning_log::all() const {
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kWarningPrefix);
  auto out = std::vector<consistency_warning_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    out.push_back(decode_warning(encoder, value));
  }
  return out;
}

std::optional<consistency_warning_t> warning_log::find(
    const tally::schema::warning_id_t id) const {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_warning_key(id);
  return storage_.get<consistency_warning_t>(encoder, make_bytes_view(key));
}

bool warning_log::resolve(const tally::schema::warning_id_t id) {
  auto lock = std::lock_guard{mutex_};
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_warning_key(id);

  auto txn = storage_.begin();
  auto raw = txn.get_for_update(make_bytes_view(key));
  if (!raw) {
    return false;
  }
  auto warning = decode_warning(encoder, *raw);
  if (warning.resolved) {
    return true;
  }
  warning.resolved = true;
  warning.resolved_at = tally::schema::now_milliseconds();
  auto encoded = encoder.encode_record(warning);
  txn.put(make_bytes_view(key), make_bytes_view(encoded));
  auto open_key = make_open_key(warning);
  txn.erase(make_bytes_view(open_key));
  txn.commit();

  spdlog::info("Resolved consistency warning #{} ({})", id,
               tally::schema::to_string(warning.type));
  return true;
}

std::size_t warning_log::prune_resolved(
    const tally::schema::timestamp_milliseconds_t resolved_before) {
  auto lock = std::lock_guard{mutex_};
  auto encoder = encoder_t{};
  auto prefix =
      tally::schema::key::make_prefix(tally::schema::key::kWarningPrefix);

  auto txn = storage_.begin();
  auto pruned = std::size_t{0};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto warning = decode_warning(encoder, value);
    if (!warning.resolved || warning.resolved_at > resolved_before) {
      continue;
    }
    txn.erase(make_bytes_view(key));
    ++pruned;
  }
  txn.commit();

  if (pruned > 0) {
    spdlog::info("Pruned {} resolved consistency warnings", pruned);
  }
  return pruned;
}

}  // namespace tally::reconciliation
