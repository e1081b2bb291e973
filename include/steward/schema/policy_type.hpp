#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: policy type.
// Governance workflow: closed tag set of monetary actions a proposal may
// carry. Mirrors the alternatives of policy_payload_t.
namespace steward::schema {

enum class policy_type_t : uint8_t {
  mint_supply = 0,
  burn_supply = 1,
  rebalance = 2,
  parameter_update = 3,
  credit_rate_update = 4
};

inline constexpr auto kPolicyTypeMappings = std::array{
    enum_mapping_t<policy_type_t>{"mint_supply", policy_type_t::mint_supply},
    enum_mapping_t<policy_type_t>{"burn_supply", policy_type_t::burn_supply},
    enum_mapping_t<policy_type_t>{"rebalance", policy_type_t::rebalance},
    enum_mapping_t<policy_type_t>{"parameter_update",
                                  policy_type_t::parameter_update},
    enum_mapping_t<policy_type_t>{"credit_rate_update",
                                  policy_type_t::credit_rate_update}};

template <>
inline std::optional<policy_type_t> try_from_string<policy_type_t>(
    const std::string_view value) {
  return from_string(value, kPolicyTypeMappings);
}

inline constexpr std::string_view to_string(const policy_type_t value) {
  return to_string(value, kPolicyTypeMappings);
}

}  // namespace steward::schema
