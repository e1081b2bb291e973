#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/global_state.hpp>
#include <steward/schema/health_level.hpp>
#include <steward/schema/oracle_state.hpp>
#include <steward/schema/vault_health_report.hpp>
#include <steward/schema/vault_state.hpp>
#include <optional>

namespace steward::execution::health_monitor {

steward::schema::health_level_t classify(
    const std::optional<uint64_t>& vhr_bps,
    const steward::schema::protocol_parameters_t& parameters);

/// Recompute VHR for `vault` from the last admitted oracle reading, persist it
/// and emit a vault_health event. Never touches the circuit breaker.
void assess(execution_context& ctx,
            const steward::schema::global_state_t& global,
            steward::schema::vault_state_t& vault);

/// Read-side summary at time `now`, including oracle staleness.
steward::schema::vault_health_report_t report(
    const steward::schema::global_state_t& global,
    const steward::schema::vault_state_t& vault,
    steward::schema::timestamp_seconds_t now,
    steward::schema::duration_seconds_t stale_after);

}  // namespace steward::execution::health_monitor
