#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/initialize_protocol.hpp>
#include <steward/schema/protocol_parameters.hpp>
#include <steward/schema/update_parameters.hpp>

namespace steward::execution::protocol_state {

/// Bounds every parameter set must satisfy, at initialization and on update.
tx_status_t validate_parameters(
    const steward::schema::protocol_parameters_t& parameters);

tx_status_t initialize(execution_context& ctx,
                       const steward::schema::initialize_protocol_t& request);

tx_status_t update_parameters(
    execution_context& ctx,
    const steward::schema::update_parameters_t& request);

}  // namespace steward::execution::protocol_state
