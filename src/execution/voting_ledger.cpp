#include <steward/execution/math.hpp>
#include <steward/execution/voting_ledger.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/policy_proposal.hpp>
#include <steward/schema/vote_record.hpp>

#include <spdlog/spdlog.h>

namespace steward::execution::voting_ledger {

using steward::schema::policy_proposal_t;
using steward::schema::proposal_status_t;
using steward::schema::transaction_error_code;
using steward::schema::vote_record_t;

tx_status_t cast(execution_context& ctx,
                 const steward::schema::cast_vote_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (request.agent == global.authority) {
    return fail(transaction_error_code::authority_cannot_vote,
                "the protocol authority cannot vote");
  }
  if (request.stake_amount == 0) {
    return fail(transaction_error_code::invalid_stake,
                "stake amount must be positive");
  }

  auto proposal_key =
      steward::schema::key::make_proposal_key(ctx.encoder(), request.proposal_id);
  auto proposal = ctx.load<policy_proposal_t>(proposal_key);
  if (!proposal) {
    return fail(transaction_error_code::proposal_missing,
                "proposal " + std::to_string(request.proposal_id) +
                    " does not exist");
  }
  if (proposal->status != proposal_status_t::active) {
    return fail(transaction_error_code::proposal_not_active,
                "proposal is not active");
  }
  if (ctx.now() >= proposal->voting_ends_at) {
    return fail(transaction_error_code::voting_closed,
                "voting window has ended");
  }

  auto vote_key = steward::schema::key::make_vote_key(
      ctx.encoder(), request.proposal_id, request.agent);
  if (ctx.exists(vote_key)) {
    return fail(transaction_error_code::duplicate_vote,
                "agent already voted on this proposal");
  }

  auto& total = request.prediction ? proposal->yes_stake : proposal->no_stake;
  auto updated = math::checked_add(
      total, steward::schema::stake_total_t{request.stake_amount});
  if (!updated) {
    return fail(transaction_error_code::stake_overflow,
                "stake total overflows");
  }
  total = *updated;

  ctx.store(std::move(vote_key),
            vote_record_t{.proposal_id = request.proposal_id,
                          .agent = request.agent,
                          .stake_amount = request.stake_amount,
                          .prediction = request.prediction,
                          .cast_at = ctx.now(),
                          .claimed = false});
  ctx.store(std::move(proposal_key), *proposal);

  spdlog::debug("Vote on proposal {} by {}: {} x {}", request.proposal_id,
                to_hex(request.agent), request.prediction ? "yes" : "no",
                request.stake_amount);
  ctx.emit("vote_cast",
           {{"proposal_id", std::to_string(request.proposal_id)},
            {"agent", to_hex(request.agent)},
            {"prediction", request.prediction ? "yes" : "no"},
            {"stake_amount", std::to_string(request.stake_amount)}});
  return std::nullopt;
}

tx_status_t settle(execution_context& ctx,
                   const steward::schema::settle_vote_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (request.settlement_service != global.settlement_service) {
    return fail(transaction_error_code::unauthorized,
                "caller is not the settlement service");
  }

  auto proposal = ctx.load<policy_proposal_t>(
      steward::schema::key::make_proposal_key(ctx.encoder(),
                                              request.proposal_id));
  if (!proposal) {
    return fail(transaction_error_code::proposal_missing,
                "proposal " + std::to_string(request.proposal_id) +
                    " does not exist");
  }
  if (!steward::schema::is_resolved(proposal->status)) {
    return fail(transaction_error_code::proposal_not_resolved,
                "proposal is still active");
  }

  auto vote_key = steward::schema::key::make_vote_key(
      ctx.encoder(), request.proposal_id, request.agent);
  auto vote = ctx.load<vote_record_t>(vote_key);
  if (!vote) {
    return fail(transaction_error_code::vote_missing,
                "no vote recorded for agent");
  }
  if (vote->claimed) {
    return std::nullopt;
  }

  vote->claimed = true;
  ctx.store(std::move(vote_key), *vote);
  ctx.emit("vote_settled",
           {{"proposal_id", std::to_string(request.proposal_id)},
            {"agent", to_hex(request.agent)},
            {"outcome",
             std::string{steward::schema::to_string(proposal->status)}},
            {"prediction", vote->prediction ? "yes" : "no"},
            {"stake_amount", std::to_string(vote->stake_amount)}});
  return std::nullopt;
}

}  // namespace steward::execution::voting_ledger
