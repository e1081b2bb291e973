#pragma once

#include <steward/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for protocol state and history.
namespace steward::schema::key {

inline constexpr std::string_view kGlobalKeyPrefix{"SYS|STATE|GLOBAL|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kVoteKeyPrefix{"SYS|STATE|VOTE|"};
inline constexpr std::string_view kOracleKeyPrefix{"SYS|STATE|ORACLE|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kAgentKeyPrefix{"SYS|STATE|AGENT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

template <typename Encoder, typename T>
steward::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are concatenated field bytes, so this equals the
  // encoding of tuple{prefix, id} and any leading tuple fields form a
  // usable iteration prefix.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
steward::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
steward::schema::bytes_t make_global_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kGlobalKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
steward::schema::bytes_t make_oracle_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kOracleKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
steward::schema::bytes_t make_vault_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kVaultKeyPrefix,
                           std::string_view{"RESERVE"});
}

template <typename Encoder>
steward::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const steward::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
steward::schema::bytes_t make_vote_key(
    Encoder& encoder,
    const steward::schema::proposal_id_t proposal_id,
    const steward::schema::agent_id_t& agent) {
  return make_prefixed_key(encoder, kVoteKeyPrefix,
                           std::tuple{proposal_id, agent});
}

template <typename Encoder>
steward::schema::bytes_t make_vote_prefix_key(
    Encoder& encoder,
    const steward::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kVoteKeyPrefix, proposal_id);
}

template <typename Encoder>
steward::schema::bytes_t make_agent_key(
    Encoder& encoder,
    const steward::schema::public_key_t& agent) {
  return make_prefixed_key(encoder, kAgentKeyPrefix, agent);
}

// History rows use big-endian height/index so RocksDB iteration order is
// execution order.
template <typename Encoder>
steward::schema::bytes_t make_history_key(Encoder& encoder,
                                          const uint64_t height,
                                          const uint32_t index) {
  auto key = make_prefix_key(encoder, kHistoryPrefix);
  auto big_height = boost::endian::native_to_big(height);
  auto big_index = boost::endian::native_to_big(index);
  auto* height_bytes = reinterpret_cast<const uint8_t*>(&big_height);
  auto* index_bytes = reinterpret_cast<const uint8_t*>(&big_index);
  key.insert(std::end(key), height_bytes, height_bytes + sizeof(big_height));
  key.insert(std::end(key), index_bytes, index_bytes + sizeof(big_index));
  return key;
}

}  // namespace steward::schema::key
