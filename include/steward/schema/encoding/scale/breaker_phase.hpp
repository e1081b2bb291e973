#pragma once

#include <steward/schema/circuit_breaker_state.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(steward::schema,
                             breaker_phase_t,
                             steward::schema::breaker_phase_t::idle,
                             steward::schema::breaker_phase_t::requested,
                             steward::schema::breaker_phase_t::active)
