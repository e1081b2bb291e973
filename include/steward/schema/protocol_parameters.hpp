#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: protocol parameters.
// Authority-owned configuration carried inside GlobalState.
namespace steward::schema {

template <uint16_t Version>
struct protocol_parameters;

template <>
struct protocol_parameters<1> final {
  uint16_t version{1};
  duration_seconds_t epoch_duration{};
  basis_points_t mint_burn_cap_bps{};
  basis_points_t stability_fee_bps{};
  basis_points_t vhr_warning_bps{};
  basis_points_t vhr_critical_bps{};
};

using protocol_parameters_t = protocol_parameters<1>;

}  // namespace steward::schema
