#include <steward/common/critical.hpp>
#include <steward/storage/rocksdb/storage.hpp>

#include <tuple>

namespace steward::storage {

namespace {

using encoder_t = steward::schema::encoding::encoder<
    steward::schema::encoding::scale_encoder_tag>;

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    steward::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    steward::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<steward::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const steward::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    steward::common::critical("Failed to get value from RocksDB");
  }
  return steward::schema::bytes_t{std::begin(value), std::end(value)};
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get(steward::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<std::tuple<
      int64_t, steward::schema::hash32_t, steward::schema::timestamp_seconds_t>>(
      steward::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    steward::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded),
                         .block_time = std::get<2>(*decoded)};
}

void storage<rocksdb_storage_tag>::commit(const committed_state& state,
                                          const write_set_t& writes) {
  require_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      steward::common::critical("failed staging write batch entry");
    }
  }

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time});
  auto state_status = batch.Put(
      detail::to_slice(
          steward::schema::make_bytes_view(detail::kCommittedStateKey)),
      detail::to_slice(steward::schema::bytes_view_t{encoded}));
  if (!state_status.ok()) {
    steward::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block at height {}: {}", state.height,
                  write_status.ToString());
    steward::common::critical("failed to commit block write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const steward::schema::bytes_view_t& prefix) const {
  require_open(database);
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = steward::schema::make_string_view(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    steward::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace steward::storage
