#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::storage {

namespace {

constexpr auto kLockTimeoutMilliseconds = int64_t{5000};

void require_open(const ROCKSDB_NAMESPACE::TransactionDB* database) {
  if (database == nullptr) {
    tally::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

void detail::raise(const std::string_view& what,
                   const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("{}: {}", what, status.ToString());
  throw storage_error{std::string{what} + ": " + status.ToString()};
}

transaction<rocksdb_storage_tag>::transaction(
    std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn)
    : handle{std::move(txn)} {}

transaction<rocksdb_storage_tag>::~transaction() {
  if (!handle || committed) {
    return;
  }
  auto status = handle->Rollback();
  if (!status.ok()) {
    spdlog::error("Failed to roll back RocksDB transaction: {}",
                  status.ToString());
  }
}

std::optional<tally::schema::bytes_t>
transaction<rocksdb_storage_tag>::get_for_update(
    const tally::schema::bytes_view_t& key) {
  auto value = std::string{};
  auto status = handle->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                     detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::raise("Failed to lock key in RocksDB transaction", status);
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

std::optional<tally::schema::bytes_t> transaction<rocksdb_storage_tag>::get(
    const tally::schema::bytes_view_t& key) {
  auto value = std::string{};
  auto status = handle->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                            detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::raise("Failed to read key in RocksDB transaction", status);
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

void transaction<rocksdb_storage_tag>::put(
    const tally::schema::bytes_view_t& key,
    const tally::schema::bytes_view_t& value) {
  auto status = handle->Put(detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    detail::raise("Failed to write key in RocksDB transaction", status);
  }
}

void transaction<rocksdb_storage_tag>::erase(
    const tally::schema::bytes_view_t& key) {
  auto status = handle->Delete(detail::to_slice(key));
  if (!status.ok()) {
    detail::raise("Failed to delete key in RocksDB transaction", status);
  }
}

void transaction<rocksdb_storage_tag>::commit() {
  auto status = handle->Commit();
  if (!status.ok()) {
    detail::raise("Failed to commit RocksDB transaction", status);
  }
  committed = true;
}

std::optional<key_value_entry_t> cursor<rocksdb_storage_tag>::next() {
  auto prefix_slice = detail::to_slice(
      tally::schema::bytes_view_t{prefix.data(), prefix.size()});
  if (!started) {
    iterator->Seek(prefix_slice);
    started = true;
  } else if (iterator->Valid()) {
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    detail::raise("Failed to advance RocksDB cursor", iterator->status());
  }
  if (!iterator->Valid() || !iterator->key().starts_with(prefix_slice)) {
    return std::nullopt;
  }
  return key_value_entry_t{detail::to_bytes(iterator->key()),
                           detail::to_bytes(iterator->value())};
}

std::optional<tally::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const tally::schema::bytes_view_t& key) const {
  require_open(database.get());
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::raise("Failed to get value from RocksDB", status);
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::put_raw(
    const tally::schema::bytes_view_t& key,
    const tally::schema::bytes_view_t& value) const {
  require_open(database.get());
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    detail::raise("Failed to put value into RocksDB", status);
  }
}

void storage<rocksdb_storage_tag>::erase(
    const tally::schema::bytes_view_t& key) const {
  require_open(database.get());
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    detail::raise("Failed to delete value from RocksDB", status);
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  require_open(database.get());

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    detail::raise("Failed to iterate RocksDB prefix", iterator->status());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const tally::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  require_open(database.get());

  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      detail::raise("Failed deleting key during prefix replacement",
                    delete_status);
    }
  }
  if (!iterator->status().ok()) {
    detail::raise("Failed to iterate RocksDB prefix", iterator->status());
  }

  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(tally::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            tally::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      detail::raise("Failed writing key during prefix replacement",
                    put_status);
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    detail::raise("Failed to commit prefix replacement", write_status);
  }
}

cursor<rocksdb_storage_tag> storage<rocksdb_storage_tag>::scan(
    const tally::schema::bytes_view_t& prefix) const {
  require_open(database.get());
  return cursor<rocksdb_storage_tag>{
      .iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
          database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})},
      .prefix = tally::schema::make_bytes(prefix)};
}

transaction<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin() const {
  require_open(database.get());
  auto options = ROCKSDB_NAMESPACE::TransactionOptions{};
  options.lock_timeout = kLockTimeoutMilliseconds;
  return transaction<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{database->BeginTransaction(
          ROCKSDB_NAMESPACE::WriteOptions{}, options)}};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  auto transaction_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  transaction_options.transaction_lock_timeout = kLockTimeoutMilliseconds;

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, transaction_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    throw storage_error{"Failed to open RocksDB at " + std::string{path}};
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace tally::storage
