#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/circuit_breaker_actions.hpp>

namespace steward::execution::circuit_breaker {

/// Idle -> Requested(now). A pending or active breaker cannot be re-requested.
tx_status_t request(execution_context& ctx,
                    const steward::schema::request_circuit_breaker_t& request);

/// Requested -> Active once circuit_breaker_delay has elapsed.
tx_status_t activate(
    execution_context& ctx,
    const steward::schema::activate_circuit_breaker_t& request);

/// Active -> Idle with no delay. Also withdraws a pending request.
tx_status_t resume(execution_context& ctx,
                   const steward::schema::resume_operations_t& request);

/// Fails with circuit_breaker_active while reserve operations are halted.
tx_status_t require_operational(const steward::schema::global_state_t& global);

}  // namespace steward::execution::circuit_breaker
