#pragma once
#include <steward/schema/primitives.hpp>

namespace steward::schema {

template <uint16_t Version>
struct finalize_proposal;

template <>
struct finalize_proposal<1> final {
  uint16_t version{1};
  agent_id_t caller{};
  proposal_id_t proposal_id{};
};

using finalize_proposal_t = finalize_proposal<1>;

}  // namespace steward::schema
