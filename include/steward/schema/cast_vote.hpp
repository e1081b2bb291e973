#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: cast vote.
// `prediction` true backs the proposal passing. Stake custody is external.
namespace steward::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  agent_id_t agent{};
  proposal_id_t proposal_id{};
  bool prediction{};
  stake_t stake_amount{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace steward::schema
