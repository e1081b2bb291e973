#pragma once
#include <steward/schema/policy_type.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/protocol_parameter.hpp>
#include <variant>
#include <vector>

// Schema type: policy payload.
// Governance workflow: type-specific parameters of a proposal. Validated once
// at creation, applied on execution.
namespace steward::schema {

struct mint_supply_t final {
  amount_t amount{};
};

struct burn_supply_t final {
  amount_t amount{};
};

struct asset_weight_t final {
  hash32_t asset_id{};
  basis_points_t weight_bps{};
};

struct rebalance_t final {
  std::vector<asset_weight_t> targets;
};

struct parameter_update_t final {
  protocol_parameter_t parameter{protocol_parameter_t::epoch_duration};
  uint64_t value{};
};

struct credit_rate_update_t final {
  basis_points_t rate_bps{};
};

using policy_payload_t = std::variant<mint_supply_t,
                                      burn_supply_t,
                                      rebalance_t,
                                      parameter_update_t,
                                      credit_rate_update_t>;

inline policy_type_t policy_type_of(const policy_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const mint_supply_t&) { return policy_type_t::mint_supply; },
          [](const burn_supply_t&) { return policy_type_t::burn_supply; },
          [](const rebalance_t&) { return policy_type_t::rebalance; },
          [](const parameter_update_t&) {
            return policy_type_t::parameter_update;
          },
          [](const credit_rate_update_t&) {
            return policy_type_t::credit_rate_update;
          }},
      payload);
}

// Mint, burn and rebalance move the reserve and trigger a health assessment.
inline bool is_reserve_affecting(const policy_payload_t& payload) {
  return !std::holds_alternative<parameter_update_t>(payload) &&
         !std::holds_alternative<credit_rate_update_t>(payload);
}

}  // namespace steward::schema
