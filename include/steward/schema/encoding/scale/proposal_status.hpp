#pragma once

#include <steward/schema/proposal_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(steward::schema,
                             proposal_status_t,
                             steward::schema::proposal_status_t::active,
                             steward::schema::proposal_status_t::passed,
                             steward::schema::proposal_status_t::failed,
                             steward::schema::proposal_status_t::executed,
                             steward::schema::proposal_status_t::cancelled)
