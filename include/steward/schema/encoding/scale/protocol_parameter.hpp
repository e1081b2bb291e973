#pragma once

#include <steward/schema/protocol_parameter.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    steward::schema,
    protocol_parameter_t,
    steward::schema::protocol_parameter_t::epoch_duration,
    steward::schema::protocol_parameter_t::mint_burn_cap_bps,
    steward::schema::protocol_parameter_t::stability_fee_bps)
