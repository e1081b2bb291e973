#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: settle vote.
// Settlement service marks a vote on a resolved proposal as claimed.
namespace steward::schema {

template <uint16_t Version>
struct settle_vote;

template <>
struct settle_vote<1> final {
  uint16_t version{1};
  public_key_t settlement_service{};
  proposal_id_t proposal_id{};
  agent_id_t agent{};
};

using settle_vote_t = settle_vote<1>;

}  // namespace steward::schema
