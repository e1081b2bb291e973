#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/cancel_proposal.hpp>
#include <steward/schema/create_proposal.hpp>
#include <steward/schema/execute_proposal.hpp>
#include <steward/schema/finalize_proposal.hpp>
#include <steward/schema/policy_payload.hpp>
#include <steward/schema/policy_proposal.hpp>

namespace steward::execution::proposal_registry {

inline constexpr std::size_t kMaxRebalanceTargets = 8;
inline constexpr steward::schema::duration_seconds_t kMaxEpochDuration =
    31'536'000;

/// Schema validation of a policy payload at creation time.
tx_status_t validate_payload(const steward::schema::policy_payload_t& payload);

/// Issue the next proposal id from GlobalState.proposal_counter and open its
/// voting window. The id is written to the transaction result data.
tx_status_t create(execution_context& ctx,
                   const steward::schema::create_proposal_t& request);

/// Close voting after the window ends: strictly more than 5000 bps of stake
/// on yes passes, everything else fails.
tx_status_t finalize(execution_context& ctx,
                     const steward::schema::finalize_proposal_t& request);

/// Apply a passed proposal once execution_delay has elapsed since passed_at.
tx_status_t execute(execution_context& ctx,
                    const steward::schema::execute_proposal_t& request);

/// Authority-only withdrawal of an active proposal before voting ends.
tx_status_t cancel(execution_context& ctx,
                   const steward::schema::cancel_proposal_t& request);

}  // namespace steward::execution::proposal_registry
