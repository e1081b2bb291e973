#pragma once

#include <steward/execution/context.hpp>
#include <steward/execution/engine_config.hpp>
#include <steward/schema/oracle_reading.hpp>
#include <steward/schema/update_oracle.hpp>

namespace steward::execution::oracle_gate {

/// Per-field bounds, each checked independently.
tx_status_t validate_reading(const steward::schema::oracle_reading_t& reading,
                             const oracle_bounds_t& bounds);

/// Admit a reading when every field is in bounds and both the minimum
/// interval and the minimum slot buffer have passed since the last admitted
/// update. Admission triggers a vault health assessment.
tx_status_t update(execution_context& ctx,
                   const steward::schema::update_oracle_t& request);

}  // namespace steward::execution::oracle_gate
