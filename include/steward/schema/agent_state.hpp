#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: agent state.
// Per-identity nonce bound into every signed message.
namespace steward::schema {

template <uint16_t Version>
struct agent_state;

template <>
struct agent_state<1> final {
  uint16_t version{1};
  public_key_t agent{};
  uint64_t nonce{};
  timestamp_seconds_t last_action_at{};
};

using agent_state_t = agent_state<1>;

}  // namespace steward::schema
