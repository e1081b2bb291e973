#pragma once
#include <steward/schema/policy_payload.hpp>
#include <steward/schema/primitives.hpp>

// Schema type: create proposal.
// The voting window opens at block time and lasts `voting_duration` seconds.
namespace steward::schema {

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  uint16_t version{1};
  agent_id_t proposer{};
  policy_payload_t payload{};
  duration_seconds_t voting_duration{};
};

using create_proposal_t = create_proposal<1>;

}  // namespace steward::schema
