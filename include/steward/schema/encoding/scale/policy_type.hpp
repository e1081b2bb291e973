#pragma once

#include <steward/schema/policy_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    steward::schema,
    policy_type_t,
    steward::schema::policy_type_t::mint_supply,
    steward::schema::policy_type_t::burn_supply,
    steward::schema::policy_type_t::rebalance,
    steward::schema::policy_type_t::parameter_update,
    steward::schema::policy_type_t::credit_rate_update)
