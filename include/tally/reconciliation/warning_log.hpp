#pragma once
#include <tally/schema/consistency_warning.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace tally::reconciliation {

using storage_t = tally::storage::rocksdb_storage_t;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

/// Persisted queue of consistency warnings under `WARN|`. Unresolved warnings
/// are also indexed by condition under `WARNOPEN|`, so recording and listing
/// pending work never scans resolved history.
class warning_log final {
 public:
  explicit warning_log(storage_t& storage);

  /// Persist a warning and assign its id. A pending warning with the same
  /// type, account and entry is updated in place instead of duplicated.
  tally::schema::consistency_warning_t record(
      tally::schema::consistency_warning_t warning);

  /// Unresolved warnings, oldest first.
  std::vector<tally::schema::consistency_warning_t> pending() const;
  std::vector<tally::schema::consistency_warning_t> all() const;
  std::optional<tally::schema::consistency_warning_t> find(
      tally::schema::warning_id_t id) const;

  /// Mark a warning resolved. False when the id is unknown.
  bool resolve(tally::schema::warning_id_t id);

  /// Delete warnings resolved at or before `resolved_before`. Returns the
  /// number deleted.
  std::size_t prune_resolved(
      tally::schema::timestamp_milliseconds_t resolved_before);

 private:
  storage_t& storage_;
  std::mutex mutex_;
};

}  // namespace tally::reconciliation
