#pragma once
#include <steward/schema/circuit_breaker_state.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/protocol_parameters.hpp>
#include <optional>

// Schema type: global state.
// Singleton created by initialize_protocol. Reserve vault and token mint
// references are pinned there and never rewritten.
namespace steward::schema {

template <uint16_t Version>
struct global_state;

template <>
struct global_state<1> final {
  uint16_t version{1};
  public_key_t authority{};
  public_key_t oracle{};
  public_key_t settlement_service{};
  public_key_t reserve_vault{};
  public_key_t token_mint{};
  protocol_parameters_t parameters{};
  basis_points_t credit_rate_bps{};
  proposal_id_t proposal_counter{};
  circuit_breaker_state_t circuit_breaker{};
  std::optional<timestamp_seconds_t> last_oracle_update_at;
  std::optional<slot_t> last_oracle_update_slot;
  timestamp_seconds_t initialized_at{};
};

using global_state_t = global_state<1>;

}  // namespace steward::schema
