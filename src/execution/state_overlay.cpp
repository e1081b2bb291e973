#include <steward/execution/state_overlay.hpp>

#include <utility>

namespace steward::execution {

state_overlay::state_overlay(reader_t reader) : reader_{std::move(reader)} {}

std::optional<steward::schema::bytes_t> state_overlay::get(
    const steward::schema::bytes_view_t& key) const {
  auto staged = writes_.find(steward::schema::make_bytes(key));
  if (staged != std::end(writes_)) {
    return staged->second;
  }
  return reader_(key);
}

bool state_overlay::contains(const steward::schema::bytes_view_t& key) const {
  return get(key).has_value();
}

void state_overlay::put(steward::schema::bytes_t key,
                        steward::schema::bytes_t value) {
  writes_.insert_or_assign(std::move(key), std::move(value));
}

void state_overlay::merge(const state_overlay& child) {
  for (const auto& [key, value] : child.writes_) {
    writes_.insert_or_assign(key, value);
  }
}

const steward::storage::write_set_t& state_overlay::writes() const {
  return writes_;
}

void state_overlay::clear() {
  writes_.clear();
}

}  // namespace steward::execution
