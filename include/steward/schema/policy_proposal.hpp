#pragma once
#include <steward/schema/policy_payload.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/proposal_status.hpp>
#include <optional>

// Schema type: policy proposal.
// Governance workflow: one record per issued id. Stake totals accumulate while
// active; passed_at is written once, on the transition to passed.
namespace steward::schema {

template <uint16_t Version>
struct policy_proposal;

template <>
struct policy_proposal<1> final {
  uint16_t version{1};
  proposal_id_t id{};
  agent_id_t proposer{};
  policy_payload_t payload{};
  timestamp_seconds_t voting_starts_at{};
  timestamp_seconds_t voting_ends_at{};
  stake_total_t yes_stake{};
  stake_total_t no_stake{};
  proposal_status_t status{proposal_status_t::active};
  std::optional<timestamp_seconds_t> passed_at;
  std::optional<timestamp_seconds_t> resolved_at;
  std::optional<timestamp_seconds_t> executed_at;
};

using policy_proposal_t = policy_proposal<1>;

}  // namespace steward::schema
