#pragma once
#include <tally/schema/account.hpp>
#include <tally/schema/consistency_warning.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/posting_result.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tally::directory {

using storage_t = tally::storage::rocksdb_storage_t;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCodespace = std::string_view{"tally.directory"};

/// Chart of accounts. Accounts are persisted under `ACCT|` with a code index
/// and mirrored in memory; every read is served from the in-memory copy.
class account_directory final {
 public:
  explicit account_directory(storage_t& storage);

  /// Active account by code. Retired and unknown codes both return nothing.
  std::optional<tally::schema::account_t> lookup(std::string_view code) const;

  /// Any account by id, retired included.
  std::optional<tally::schema::account_t> find(
      tally::schema::account_id_t id) const;
  std::optional<tally::schema::account_t> find_by_code(
      std::string_view code) const;

  /// Direct children ordered by code.
  std::vector<tally::schema::account_t> children(
      tally::schema::account_id_t id) const;

  /// Parent first, root last. Stops at a cycle or a dangling parent id.
  std::vector<tally::schema::account_t> ancestors(
      tally::schema::account_id_t id) const;

  bool is_header(tally::schema::account_id_t id) const;

  /// Number of ancestors; a root account has depth 0.
  uint32_t depth(tally::schema::account_id_t id) const;

  /// Whether code names an active leaf account, the only kind of account a
  /// journal line may reference.
  tally::schema::posting_result_t check_postable(std::string_view code) const;

  /// Create an account. Re-defining an identical account is a no-op.
  tally::schema::posting_result_t define(
      const tally::schema::account_definition& definition);

  /// Mark an account inactive. Accounts are never deleted.
  tally::schema::posting_result_t retire(std::string_view code);

  /// All accounts ordered by code.
  std::vector<tally::schema::account_t> all() const;

  std::vector<tally::schema::consistency_warning_t> validate_hierarchy() const;

 private:
  std::optional<tally::schema::account_t> find_locked(
      tally::schema::account_id_t id) const;
  std::optional<tally::schema::account_t> find_by_code_locked(
      std::string_view code) const;
  void persist(const tally::schema::account_t& account);

  storage_t& storage_;
  mutable std::shared_mutex mutex_;
  std::map<tally::schema::account_id_t, tally::schema::account_t> accounts_;
  std::map<std::string, tally::schema::account_id_t, std::less<>> codes_;
};

/// Standard chart of accounts, parents before children.
std::vector<tally::schema::account_definition> default_chart();

/// Define every account of `chart` in order. Returns the first failure.
tally::schema::posting_result_t seed(
    account_directory& directory,
    const std::vector<tally::schema::account_definition>& chart);

}  // namespace tally::directory
