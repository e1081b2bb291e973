#pragma once

#include <steward/schema/health_level.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(steward::schema,
                             health_level_t,
                             steward::schema::health_level_t::healthy,
                             steward::schema::health_level_t::warning,
                             steward::schema::health_level_t::critical)
