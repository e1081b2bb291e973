#pragma once

#include <steward/schema/primitives.hpp>
#include <steward/storage/storage.hpp>
#include <functional>
#include <optional>

namespace steward::execution {

/// Copy-on-write view over a lower layer (committed storage or another
/// overlay). Writes stay staged until merged into the parent or committed.
class state_overlay final {
 public:
  using reader_t = std::function<std::optional<steward::schema::bytes_t>(
      const steward::schema::bytes_view_t&)>;

  explicit state_overlay(reader_t reader);

  std::optional<steward::schema::bytes_t> get(
      const steward::schema::bytes_view_t& key) const;
  bool contains(const steward::schema::bytes_view_t& key) const;

  void put(steward::schema::bytes_t key, steward::schema::bytes_t value);

  /// Fold the staged writes of a child overlay into this one.
  void merge(const state_overlay& child);

  const steward::storage::write_set_t& writes() const;
  void clear();

 private:
  reader_t reader_;
  steward::storage::write_set_t writes_;
};

}  // namespace steward::execution
