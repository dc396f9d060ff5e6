#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace tally::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline tally::schema::bytes_view_t to_view(const std::string& value) {
  return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

[[noreturn]] void raise(const std::string_view& what,
                        const ROCKSDB_NAMESPACE::Status& status);

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle;
  bool committed{false};

  explicit transaction(std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn);
  transaction(transaction&&) = default;
  transaction& operator=(transaction&&) = default;
  ~transaction();

  std::optional<tally::schema::bytes_t> get_for_update(
      const tally::schema::bytes_view_t& key);
  std::optional<tally::schema::bytes_t> get(
      const tally::schema::bytes_view_t& key);
  void put(const tally::schema::bytes_view_t& key,
           const tally::schema::bytes_view_t& value);
  void erase(const tally::schema::bytes_view_t& key);

  template <typename Encoder>
  uint64_t next_sequence(Encoder& encoder, const std::string_view& key);

  void commit();
};

template <>
struct cursor<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator;
  tally::schema::bytes_t prefix;
  bool started{false};

  std::optional<key_value_entry_t> next();
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  template <typename T, typename Encoder>
  std::optional<T> get_value(Encoder& encoder,
                             const tally::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put_value(Encoder& encoder,
                 const tally::schema::bytes_view_t& key,
                 const T& value) const;

  std::optional<tally::schema::bytes_t> get_raw(
      const tally::schema::bytes_view_t& key) const;
  void put_raw(const tally::schema::bytes_view_t& key,
               const tally::schema::bytes_view_t& value) const;
  void erase(const tally::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const tally::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
  cursor<rocksdb_storage_tag> scan(
      const tally::schema::bytes_view_t& prefix) const;
  transaction<rocksdb_storage_tag> begin() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;
using rocksdb_transaction_t = transaction<rocksdb_storage_tag>;
using rocksdb_cursor_t = cursor<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder>
uint64_t transaction<rocksdb_storage_tag>::next_sequence(
    Encoder& encoder,
    const std::string_view& key) {
  auto key_view = tally::schema::make_bytes_view(key);
  auto current = uint64_t{0};
  if (auto raw = get_for_update(key_view)) {
    auto decoded = encoder.template try_decode<uint64_t>(
        tally::schema::bytes_view_t{raw->data(), raw->size()});
    if (!decoded) {
      throw storage_error{"corrupt sequence counter"};
    }
    current = *decoded;
  }
  auto next = current + 1;
  auto encoded = encoder.encode(next);
  put(key_view, tally::schema::bytes_view_t{encoded.data(), encoded.size()});
  return next;
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode_record<T>(
      tally::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    spdlog::error("Corrupt record at key {}", tally::schema::to_hex(key));
    throw storage_error{"corrupt record"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tally::schema::bytes_view_t& key,
                                       const T& value) const {
  auto encoded = encoder.encode_record(value);
  put_raw(key, tally::schema::bytes_view_t{encoded.data(), encoded.size()});
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get_value(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      tally::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    spdlog::error("Corrupt value at key {}", tally::schema::to_hex(key));
    throw storage_error{"corrupt value"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put_value(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded = encoder.encode(value);
  put_raw(key, tally::schema::bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace tally::storage
