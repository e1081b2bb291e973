#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: protocol parameter selector.
// Governance workflow: names the GlobalState field a ParameterUpdate proposal
// rewrites.
namespace steward::schema {

enum class protocol_parameter_t : uint8_t {
  epoch_duration = 0,
  mint_burn_cap_bps = 1,
  stability_fee_bps = 2
};

inline constexpr auto kProtocolParameterMappings = std::array{
    enum_mapping_t<protocol_parameter_t>{"epoch_duration",
                                         protocol_parameter_t::epoch_duration},
    enum_mapping_t<protocol_parameter_t>{
        "mint_burn_cap_bps", protocol_parameter_t::mint_burn_cap_bps},
    enum_mapping_t<protocol_parameter_t>{
        "stability_fee_bps", protocol_parameter_t::stability_fee_bps}};

template <>
inline std::optional<protocol_parameter_t>
try_from_string<protocol_parameter_t>(const std::string_view value) {
  return from_string(value, kProtocolParameterMappings);
}

inline constexpr std::string_view to_string(const protocol_parameter_t value) {
  return to_string(value, kProtocolParameterMappings);
}

}  // namespace steward::schema
