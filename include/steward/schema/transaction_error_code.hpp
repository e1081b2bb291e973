#pragma once

#include <cstdint>

namespace steward::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  empty_transaction = 4,
  invalid_block = 5,

  missing_signature_verification = 10,
  agent_mismatch = 11,
  signature_verification_failed = 12,
  invalid_signed_message = 13,

  protocol_already_initialized = 20,
  protocol_not_initialized = 21,
  unauthorized = 22,
  invalid_parameters = 23,
  invalid_reference = 24,

  proposal_missing = 30,
  invalid_voting_period = 31,
  invalid_policy_payload = 32,
  counter_overflow = 33,
  proposal_not_active = 34,
  voting_closed = 35,
  voting_still_open = 36,
  proposal_not_passed = 37,
  execution_delay_not_elapsed = 38,
  proposal_not_resolved = 39,
  supply_cap_exceeded = 40,

  duplicate_vote = 50,
  vote_missing = 51,
  invalid_stake = 52,
  stake_overflow = 53,
  authority_cannot_vote = 54,

  oracle_value_out_of_bounds = 60,
  oracle_update_too_soon = 61,
  oracle_slot_buffer_not_met = 62,
  oracle_reading_in_future = 63,

  circuit_breaker_active = 70,
  circuit_breaker_not_idle = 71,
  circuit_breaker_not_requested = 72,
  circuit_breaker_delay_not_elapsed = 73,
  circuit_breaker_not_engaged = 74,

  invalid_amount = 80,
  insufficient_reserve = 81,
  arithmetic_overflow = 82,
};

}  // namespace steward::schema
