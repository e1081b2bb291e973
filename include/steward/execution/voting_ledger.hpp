#pragma once

#include <steward/execution/context.hpp>
#include <steward/schema/cast_vote.hpp>
#include <steward/schema/settle_vote.hpp>

namespace steward::execution::voting_ledger {

/// Record the single vote of (proposal, agent) and add its stake to the yes
/// or no total. A second vote for the same pair fails with duplicate_vote and
/// leaves both totals untouched.
tx_status_t cast(execution_context& ctx,
                 const steward::schema::cast_vote_t& request);

/// Settlement service marks a vote on a resolved proposal as claimed.
/// Settling an already-claimed vote succeeds without change.
tx_status_t settle(execution_context& ctx,
                   const steward::schema::settle_vote_t& request);

}  // namespace steward::execution::voting_ledger
