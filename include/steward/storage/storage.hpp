#pragma once
#include <steward/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace steward::storage {

using key_value_entry_t =
    std::pair<steward::schema::bytes_t, steward::schema::bytes_t>;

/// Staged writes for one block, ordered by key.
using write_set_t = std::map<steward::schema::bytes_t, steward::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  steward::schema::hash32_t state_root;
  steward::schema::timestamp_seconds_t block_time{};
};

template <typename Library>
struct storage {
  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<steward::schema::bytes_t> get(
      const steward::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const steward::schema::bytes_view_t& key) const;

  /// Encode and persist a single value outside of a block commit.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const steward::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Apply all staged writes and the checkpoint in one atomic batch.
  void commit(const committed_state& state, const write_set_t& writes);

  /// Enumerate entries whose key starts with prefix, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const steward::schema::bytes_view_t& prefix) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace steward::storage
