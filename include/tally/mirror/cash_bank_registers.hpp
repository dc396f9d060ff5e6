#pragma once
#include <tally/directory/account_directory.hpp>
#include <tally/mirror/mirror_target.hpp>
#include <tally/schema/cash_bank_register.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::mirror {

using storage_t = tally::storage::rocksdb_storage_t;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCodespace = std::string_view{"tally.mirror"};
inline constexpr auto kCashBankKind = std::string_view{"cash_bank"};

struct open_result final {
  uint32_t code{};
  std::string log;
  std::optional<tally::schema::cash_bank_register_t> value;

  bool ok() const { return code == 0; }
  tally::schema::posting_error_code error() const {
    return static_cast<tally::schema::posting_error_code>(code);
  }
};

/// Cash and bank registers. A register is linked to one active asset leaf
/// account; its balance has no setter other than `refresh`. Only open
/// registers are mirrored.
class cash_bank_registers final : public mirror_target {
 public:
  cash_bank_registers(storage_t& storage,
                      const tally::directory::account_directory& directory);

  /// Open a register with a zero balance; the next mirror refresh or sweep
  /// brings it in line with the ledger.
  open_result open(std::string_view code,
                   std::string_view name,
                   tally::schema::cash_bank_kind_t kind,
                   std::string_view account_code);

  /// Stop mirroring a register. Its row, code and last balance are kept;
  /// closing a closed register is a no-op.
  open_result close(tally::schema::register_id_t id);

  std::optional<tally::schema::cash_bank_register_t> find(
      tally::schema::register_id_t id) const;
  std::vector<tally::schema::cash_bank_register_t> find_by_account(
      tally::schema::account_id_t account_id) const;
  std::vector<tally::schema::cash_bank_register_t> all() const;

  std::string_view kind() const override;
  std::vector<tally::schema::account_id_t> mirrored_accounts() const override;
  bool mirrors(tally::schema::account_id_t account_id) const override;
  /// Writes under a row lock. A register already reflecting a newer
  /// projection, by (last_entry_id, line_count), is left as is.
  std::vector<tally::schema::mirror_balance_t> refresh(
      tally::schema::account_id_t account_id,
      const tally::schema::account_balance_t& balance) override;
  std::vector<tally::schema::mirror_balance_t> read(
      tally::schema::account_id_t account_id) const override;

 private:
  std::vector<tally::schema::register_id_t> register_ids(
      tally::schema::account_id_t account_id) const;
  std::vector<tally::schema::cash_bank_register_t> open_registers(
      tally::schema::account_id_t account_id) const;

  storage_t& storage_;
  const tally::directory::account_directory& directory_;
};

}  // namespace tally::mirror
