#pragma once
#include <steward/schema/primitives.hpp>

namespace steward::schema {

template <uint16_t Version>
struct cancel_proposal;

template <>
struct cancel_proposal<1> final {
  uint16_t version{1};
  public_key_t authority{};
  proposal_id_t proposal_id{};
};

using cancel_proposal_t = cancel_proposal<1>;

}  // namespace steward::schema
