#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: vote record.
// Governance workflow: keyed by (proposal_id, agent); written exactly once.
// Only the settlement service flips `claimed`.
namespace steward::schema {

template <uint16_t Version>
struct vote_record;

template <>
struct vote_record<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  agent_id_t agent{};
  stake_t stake_amount{};
  bool prediction{};
  timestamp_seconds_t cast_at{};
  bool claimed{};
};

using vote_record_t = vote_record<1>;

}  // namespace steward::schema
