#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// Raised for every persistence failure: I/O, lock timeouts, corrupt values.
struct storage_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Single read-write transaction. Writes become visible on `commit()`; a
/// transaction destroyed without commit is rolled back.
template <typename Library>
struct transaction {
  /// Read the committed value at key and lock the row until commit/rollback.
  std::optional<tally::schema::bytes_t> get_for_update(
      const tally::schema::bytes_view_t& key);

  /// Read through the transaction (own writes visible), without locking.
  std::optional<tally::schema::bytes_t> get(
      const tally::schema::bytes_view_t& key);

  void put(const tally::schema::bytes_view_t& key,
           const tally::schema::bytes_view_t& value);
  void erase(const tally::schema::bytes_view_t& key);

  /// Lock, increment and return the counter stored at key (first value is 1).
  template <typename Encoder>
  uint64_t next_sequence(Encoder& encoder, const std::string_view& key);

  void commit();
};

/// Forward-only scan over one key prefix, reading a consistent snapshot taken
/// when the cursor was created.
template <typename Library>
struct cursor {
  std::optional<key_value_entry_t> next();
};

template <typename Library>
struct storage {
  /// Decode and return the record at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  /// Encode and persist record at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  /// Plain SCALE value (not a schema record) at key.
  template <typename T, typename Encoder>
  std::optional<T> get_value(Encoder& encoder,
                             const tally::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put_value(Encoder& encoder,
                 const tally::schema::bytes_view_t& key,
                 const T& value) const;

  void erase(const tally::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const tally::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Lazily scan every key under prefix in key order.
  cursor<Library> scan(const tally::schema::bytes_view_t& prefix) const;

  /// Start a pessimistic read-write transaction.
  transaction<Library> begin() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
