#include <steward/execution/auth_gate.hpp>
#include <steward/schema/agent_state.hpp>
#include <steward/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>
#include <tuple>

namespace steward::execution {

using steward::schema::transaction_error_code;

std::optional<steward::schema::public_key_t> acting_identity(
    const steward::schema::instruction_t& instruction) {
  using result_t = std::optional<steward::schema::public_key_t>;
  return std::visit(
      overloaded{
          [](const steward::schema::verify_signature_t&) -> result_t {
            return std::nullopt;
          },
          [](const steward::schema::initialize_protocol_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::update_parameters_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::create_proposal_t& value) -> result_t {
            return value.proposer;
          },
          [](const steward::schema::cast_vote_t& value) -> result_t {
            return value.agent;
          },
          [](const steward::schema::finalize_proposal_t& value) -> result_t {
            return value.caller;
          },
          [](const steward::schema::execute_proposal_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::cancel_proposal_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::update_oracle_t& value) -> result_t {
            return value.reporter;
          },
          [](const steward::schema::request_circuit_breaker_t& value)
              -> result_t { return value.authority; },
          [](const steward::schema::activate_circuit_breaker_t& value)
              -> result_t { return value.authority; },
          [](const steward::schema::resume_operations_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::settle_vote_t& value) -> result_t {
            return value.settlement_service;
          },
          [](const steward::schema::deposit_reserve_t& value) -> result_t {
            return value.authority;
          },
          [](const steward::schema::withdraw_reserve_t& value) -> result_t {
            return value.authority;
          }},
      instruction);
}

steward::schema::bytes_t make_signing_message(
    encoder_t& encoder,
    const steward::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const steward::schema::instruction_t& instruction) {
  return encoder.encode(
      std::tuple{kSigningDomain, chain_id, nonce, instruction});
}

tx_status_t verify_signature_step(
    const steward::schema::verify_signature_t& step,
    const signature_verifier_t& verifier,
    const bool require_strict_crypto) {
  if (!require_strict_crypto) {
    return std::nullopt;
  }
  if (!verifier ||
      !verifier(steward::schema::bytes_view_t{step.message}, step.public_key,
                step.signature)) {
    return fail(transaction_error_code::signature_verification_failed,
                "signature verification failed");
  }
  return std::nullopt;
}

tx_status_t check_preceding_verification(
    const steward::schema::transaction_t& tx,
    const std::size_t index) {
  auto identity = acting_identity(tx.instructions.at(index));
  if (!identity) {
    return std::nullopt;
  }
  if (index == 0 || !std::holds_alternative<steward::schema::verify_signature_t>(
                        tx.instructions[index - 1])) {
    return fail(transaction_error_code::missing_signature_verification,
                "instruction is not preceded by a signature verification");
  }
  const auto& step =
      std::get<steward::schema::verify_signature_t>(tx.instructions[index - 1]);
  if (step.public_key != *identity) {
    return fail(transaction_error_code::agent_mismatch,
                "verified key does not match acting identity");
  }
  return std::nullopt;
}

tx_status_t authenticate(execution_context& ctx,
                         const steward::schema::transaction_t& tx,
                         const std::size_t index) {
  if (auto failure = check_preceding_verification(tx, index)) {
    return failure;
  }
  const auto& instruction = tx.instructions[index];
  const auto& step =
      std::get<steward::schema::verify_signature_t>(tx.instructions[index - 1]);

  auto agent_key =
      steward::schema::key::make_agent_key(ctx.encoder(), step.public_key);
  auto agent = ctx.load<steward::schema::agent_state_t>(agent_key)
                   .value_or(steward::schema::agent_state_t{
                       .agent = step.public_key});

  auto expected = make_signing_message(ctx.encoder(), ctx.chain_id(),
                                       agent.nonce, instruction);
  if (step.message != expected) {
    spdlog::debug("Signed message mismatch for {} at nonce {}",
                  to_hex(step.public_key), agent.nonce);
    return fail(transaction_error_code::invalid_signed_message,
                "signed message does not bind this instruction");
  }

  ++agent.nonce;
  agent.last_action_at = ctx.now();
  ctx.store(std::move(agent_key), agent);
  return std::nullopt;
}

}  // namespace steward::execution
