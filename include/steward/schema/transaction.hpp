#pragma once
#include <steward/schema/cancel_proposal.hpp>
#include <steward/schema/cast_vote.hpp>
#include <steward/schema/circuit_breaker_actions.hpp>
#include <steward/schema/create_proposal.hpp>
#include <steward/schema/execute_proposal.hpp>
#include <steward/schema/finalize_proposal.hpp>
#include <steward/schema/initialize_protocol.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/reserve_actions.hpp>
#include <steward/schema/settle_vote.hpp>
#include <steward/schema/update_oracle.hpp>
#include <steward/schema/update_parameters.hpp>
#include <steward/schema/verify_signature.hpp>
#include <variant>
#include <vector>

namespace steward::schema {

using instruction_t = std::variant<verify_signature_t,
                                   initialize_protocol_t,
                                   update_parameters_t,
                                   create_proposal_t,
                                   cast_vote_t,
                                   finalize_proposal_t,
                                   execute_proposal_t,
                                   cancel_proposal_t,
                                   update_oracle_t,
                                   request_circuit_breaker_t,
                                   activate_circuit_breaker_t,
                                   resume_operations_t,
                                   settle_vote_t,
                                   deposit_reserve_t,
                                   withdraw_reserve_t>;

// An atomic submission. Instructions execute in order and either all apply or
// none do.
template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  std::vector<instruction_t> instructions;
};

using transaction_t = transaction<1>;

}  // namespace steward::schema
