#pragma once

#include <gtest/gtest.h>

#include <steward/execution/auth_gate.hpp>
#include <steward/execution/engine.hpp>
#include <steward/schema/agent_state.hpp>
#include <steward/schema/encoding/scale/encoder.hpp>
#include <steward/schema/protocol_parameters.hpp>
#include <steward/schema/transaction.hpp>
#include <steward/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace steward::testing {

using scale_encoder_t = steward::schema::encoding::encoder<
    steward::schema::encoding::scale_encoder_tag>;

inline constexpr steward::schema::timestamp_seconds_t kGenesisTime =
    1'700'000'000;

inline steward::schema::protocol_parameters_t make_default_parameters() {
  return steward::schema::protocol_parameters_t{
      .epoch_duration = 86'400,
      .mint_burn_cap_bps = 500,
      .stability_fee_bps = 100,
      .vhr_warning_bps = 15'000,
      .vhr_critical_bps = 12'000};
}

/// Append a verification step for `instruction` followed by the instruction.
/// The signature is left zeroed; pair with an allow-all verifier.
inline void append_signed(steward::schema::transaction_t& tx,
                          const uint64_t nonce,
                          steward::schema::instruction_t instruction) {
  auto encoder = scale_encoder_t{};
  const auto identity = steward::execution::acting_identity(instruction);
  EXPECT_TRUE(identity.has_value());
  tx.instructions.push_back(steward::schema::verify_signature_t{
      .public_key = identity.value_or(steward::schema::public_key_t{}),
      .signature = {},
      .message = steward::execution::make_signing_message(
          encoder, tx.chain_id, nonce, instruction)});
  tx.instructions.push_back(std::move(instruction));
}

inline steward::schema::bytes_t encode_transaction(
    const steward::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

template <typename T>
std::optional<T> query_value(const steward::execution::engine& engine,
                             const std::string_view path,
                             const steward::schema::bytes_t& key = {}) {
  const auto result =
      engine.query(path, steward::schema::bytes_view_t{key});
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(steward::schema::bytes_view_t{result.value});
}

inline uint64_t agent_nonce(const steward::execution::engine& engine,
                            const steward::schema::public_key_t& agent) {
  auto encoder = scale_encoder_t{};
  const auto state = query_value<steward::schema::agent_state_t>(
      engine, "/state/agent", encoder.encode(agent));
  EXPECT_TRUE(state.has_value());
  return state ? state->nonce : 0;
}

inline bool has_event(const steward::schema::transaction_result_t& result,
                      const std::string_view type) {
  for (const auto& event : result.events) {
    if (event.type == type) {
      return true;
    }
  }
  return false;
}

inline std::optional<std::string> event_attribute(
    const steward::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
  }
  return std::nullopt;
}

inline uint32_t code_of(const steward::schema::transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace steward::testing
