#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/reserve_actions.hpp>

namespace steward::execution::reserve_custody {

tx_status_t deposit(execution_context& ctx,
                    const steward::schema::deposit_reserve_t& request);

/// Reserve debit; refused while the circuit breaker is active.
tx_status_t withdraw(execution_context& ctx,
                     const steward::schema::withdraw_reserve_t& request);

}  // namespace steward::execution::reserve_custody
