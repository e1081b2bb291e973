#pragma once
#include <steward/schema/health_level.hpp>
#include <steward/schema/policy_payload.hpp>
#include <steward/schema/primitives.hpp>
#include <optional>
#include <vector>

// Schema type: vault state.
// Reserve accounting consumed by the health monitor. vhr_bps is absent while
// there are no liabilities.
namespace steward::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  amount_t reserve_units{};
  amount_t liabilities{};
  std::optional<uint64_t> vhr_bps;
  health_level_t health{health_level_t::healthy};
  std::vector<asset_weight_t> composition;
  std::optional<timestamp_seconds_t> last_rebalance_at;
  std::optional<timestamp_seconds_t> last_assessed_at;
};

using vault_state_t = vault_state<1>;

}  // namespace steward::schema
