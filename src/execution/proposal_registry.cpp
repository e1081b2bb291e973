#include <steward/execution/circuit_breaker.hpp>
#include <steward/execution/health_monitor.hpp>
#include <steward/execution/math.hpp>
#include <steward/execution/proposal_registry.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/vault_state.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace steward::execution::proposal_registry {

using steward::schema::kBasisPointsDenominator;
using steward::schema::policy_proposal_t;
using steward::schema::proposal_status_t;
using steward::schema::transaction_error_code;

namespace {

tx_status_t invalid_payload(std::string log) {
  return fail(transaction_error_code::invalid_policy_payload, std::move(log));
}

tx_status_t validate_rebalance(const steward::schema::rebalance_t& rebalance) {
  if (rebalance.targets.empty() ||
      rebalance.targets.size() > kMaxRebalanceTargets) {
    return invalid_payload("rebalance requires 1 to 8 targets");
  }
  auto seen = std::set<steward::schema::hash32_t>{};
  auto total = uint64_t{};
  for (const auto& target : rebalance.targets) {
    if (steward::schema::is_zero(target.asset_id)) {
      return invalid_payload("rebalance target asset id is zero");
    }
    if (!seen.insert(target.asset_id).second) {
      return invalid_payload("rebalance target asset listed twice");
    }
    if (target.weight_bps == 0) {
      return invalid_payload("rebalance target weight is zero");
    }
    total += target.weight_bps;
  }
  if (total != kBasisPointsDenominator) {
    return invalid_payload("rebalance weights must sum to 10000 bps");
  }
  return std::nullopt;
}

tx_status_t validate_parameter_update(
    const steward::schema::parameter_update_t& update) {
  using enum steward::schema::protocol_parameter_t;
  switch (update.parameter) {
    case epoch_duration:
      if (update.value == 0 ||
          update.value > static_cast<uint64_t>(kMaxEpochDuration)) {
        return invalid_payload("epoch duration out of range");
      }
      return std::nullopt;
    case mint_burn_cap_bps:
    case stability_fee_bps:
      if (update.value > kBasisPointsDenominator) {
        return invalid_payload("basis point parameter exceeds 10000");
      }
      return std::nullopt;
  }
  return invalid_payload("unknown protocol parameter");
}

tx_status_t load_proposal(execution_context& ctx,
                          const steward::schema::proposal_id_t id,
                          policy_proposal_t& out) {
  auto proposal = ctx.load<policy_proposal_t>(
      steward::schema::key::make_proposal_key(ctx.encoder(), id));
  if (!proposal) {
    return fail(transaction_error_code::proposal_missing,
                "proposal " + std::to_string(id) + " does not exist");
  }
  out = std::move(*proposal);
  return std::nullopt;
}

void store_proposal(execution_context& ctx, const policy_proposal_t& proposal) {
  ctx.store(steward::schema::key::make_proposal_key(ctx.encoder(), proposal.id),
            proposal);
}

tx_status_t apply_supply_change(const steward::schema::global_state_t& global,
                                steward::schema::vault_state_t& vault,
                                const steward::schema::amount_t& amount,
                                const bool mint) {
  if (vault.liabilities > 0 &&
      !math::within_cap(amount, vault.liabilities,
                        global.parameters.mint_burn_cap_bps)) {
    return fail(transaction_error_code::supply_cap_exceeded,
                "supply change exceeds the mint/burn cap");
  }
  auto updated = mint ? math::checked_add(vault.liabilities, amount)
                      : math::checked_sub(vault.liabilities, amount);
  if (!updated) {
    return fail(mint ? transaction_error_code::arithmetic_overflow
                     : transaction_error_code::invalid_amount,
                mint ? "liabilities overflow" : "burn exceeds liabilities");
  }
  vault.liabilities = *updated;
  return std::nullopt;
}

tx_status_t apply_payload(execution_context& ctx,
                          steward::schema::global_state_t& global,
                          steward::schema::vault_state_t& vault,
                          const steward::schema::policy_payload_t& payload) {
  return std::visit(
      overloaded{
          [&](const steward::schema::mint_supply_t& value) {
            return apply_supply_change(global, vault, value.amount, true);
          },
          [&](const steward::schema::burn_supply_t& value) {
            return apply_supply_change(global, vault, value.amount, false);
          },
          [&](const steward::schema::rebalance_t& value) -> tx_status_t {
            vault.composition = value.targets;
            vault.last_rebalance_at = ctx.now();
            return std::nullopt;
          },
          [&](const steward::schema::parameter_update_t& value) -> tx_status_t {
            using enum steward::schema::protocol_parameter_t;
            switch (value.parameter) {
              case epoch_duration:
                global.parameters.epoch_duration =
                    static_cast<steward::schema::duration_seconds_t>(
                        value.value);
                break;
              case mint_burn_cap_bps:
                global.parameters.mint_burn_cap_bps =
                    static_cast<steward::schema::basis_points_t>(value.value);
                break;
              case stability_fee_bps:
                global.parameters.stability_fee_bps =
                    static_cast<steward::schema::basis_points_t>(value.value);
                break;
            }
            return std::nullopt;
          },
          [&](const steward::schema::credit_rate_update_t& value)
              -> tx_status_t {
            global.credit_rate_bps = value.rate_bps;
            return std::nullopt;
          }},
      payload);
}

}  // namespace

tx_status_t validate_payload(const steward::schema::policy_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const steward::schema::mint_supply_t& value) -> tx_status_t {
            if (value.amount == 0) {
              return invalid_payload("mint amount must be positive");
            }
            return std::nullopt;
          },
          [](const steward::schema::burn_supply_t& value) -> tx_status_t {
            if (value.amount == 0) {
              return invalid_payload("burn amount must be positive");
            }
            return std::nullopt;
          },
          [](const steward::schema::rebalance_t& value) {
            return validate_rebalance(value);
          },
          [](const steward::schema::parameter_update_t& value) {
            return validate_parameter_update(value);
          },
          [](const steward::schema::credit_rate_update_t& value)
              -> tx_status_t {
            if (value.rate_bps > kBasisPointsDenominator) {
              return invalid_payload("credit rate exceeds 10000 bps");
            }
            return std::nullopt;
          }},
      payload);
}

tx_status_t create(execution_context& ctx,
                   const steward::schema::create_proposal_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = circuit_breaker::require_operational(global)) {
    return failure;
  }
  const auto& config = ctx.config();
  if (request.voting_duration < config.min_voting_period ||
      request.voting_duration > config.max_voting_period) {
    return fail(transaction_error_code::invalid_voting_period,
                "voting duration outside [" +
                    std::to_string(config.min_voting_period) + ", " +
                    std::to_string(config.max_voting_period) + "]");
  }
  if (auto failure = validate_payload(request.payload)) {
    return failure;
  }

  const auto id = global.proposal_counter;
  auto next = math::checked_add(id, steward::schema::proposal_id_t{1});
  if (!next) {
    return fail(transaction_error_code::counter_overflow,
                "proposal counter exhausted");
  }

  auto voting_ends_at = math::checked_add(ctx.now(), request.voting_duration);
  if (!voting_ends_at) {
    return fail(transaction_error_code::arithmetic_overflow,
                "voting window end overflows");
  }

  auto proposal = policy_proposal_t{
      .id = id,
      .proposer = request.proposer,
      .payload = request.payload,
      .voting_starts_at = ctx.now(),
      .voting_ends_at = *voting_ends_at,
      .yes_stake = 0,
      .no_stake = 0,
      .status = proposal_status_t::active};
  store_proposal(ctx, proposal);
  global.proposal_counter = *next;
  ctx.store_global(global);

  const auto type = steward::schema::policy_type_of(request.payload);
  spdlog::info("Proposal {} created ({}) by {}", id,
               steward::schema::to_string(type), to_hex(request.proposer));
  ctx.set_data(ctx.encoder().encode(id));
  ctx.emit("proposal_created",
           {{"proposal_id", std::to_string(id)},
            {"proposer", to_hex(request.proposer)},
            {"policy_type", std::string{steward::schema::to_string(type)}},
            {"voting_ends_at", std::to_string(proposal.voting_ends_at)}});
  return std::nullopt;
}

tx_status_t finalize(execution_context& ctx,
                     const steward::schema::finalize_proposal_t& request) {
  auto proposal = policy_proposal_t{};
  if (auto failure = load_proposal(ctx, request.proposal_id, proposal)) {
    return failure;
  }
  if (proposal.status != proposal_status_t::active) {
    return fail(transaction_error_code::proposal_not_active,
                "proposal is " +
                    std::string{steward::schema::to_string(proposal.status)});
  }
  if (ctx.now() < proposal.voting_ends_at) {
    return fail(transaction_error_code::voting_still_open,
                "voting ends at " + std::to_string(proposal.voting_ends_at));
  }

  const auto ratio =
      math::approval_ratio_bps(proposal.yes_stake, proposal.no_stake);
  if (ratio && *ratio > math::kPassThresholdBps) {
    proposal.status = proposal_status_t::passed;
    proposal.passed_at = ctx.now();
  } else {
    proposal.status = proposal_status_t::failed;
  }
  proposal.resolved_at = ctx.now();
  store_proposal(ctx, proposal);

  spdlog::info("Proposal {} finalized as {} (yes={}, no={})", proposal.id,
               steward::schema::to_string(proposal.status),
               proposal.yes_stake.str(), proposal.no_stake.str());
  ctx.emit("proposal_finalized",
           {{"proposal_id", std::to_string(proposal.id)},
            {"status", std::string{steward::schema::to_string(proposal.status)}},
            {"yes_stake", proposal.yes_stake.str()},
            {"no_stake", proposal.no_stake.str()},
            {"approval_bps", ratio ? std::to_string(*ratio) : "none"}});
  return std::nullopt;
}

tx_status_t execute(execution_context& ctx,
                    const steward::schema::execute_proposal_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  if (auto failure = circuit_breaker::require_operational(global)) {
    return failure;
  }
  auto proposal = policy_proposal_t{};
  if (auto failure = load_proposal(ctx, request.proposal_id, proposal)) {
    return failure;
  }
  if (proposal.status != proposal_status_t::passed ||
      !proposal.passed_at.has_value()) {
    return fail(transaction_error_code::proposal_not_passed,
                "proposal is " +
                    std::string{steward::schema::to_string(proposal.status)});
  }
  auto executable_at =
      math::checked_add(*proposal.passed_at, ctx.config().execution_delay);
  if (!executable_at) {
    return fail(transaction_error_code::arithmetic_overflow,
                "execution delay overflows");
  }
  if (ctx.now() < *executable_at) {
    return fail(transaction_error_code::execution_delay_not_elapsed,
                "executable at " + std::to_string(*executable_at));
  }

  auto vault_key = steward::schema::key::make_vault_key(ctx.encoder());
  auto vault = ctx.load<steward::schema::vault_state_t>(vault_key).value_or(
      steward::schema::vault_state_t{});
  if (auto failure = apply_payload(ctx, global, vault, proposal.payload)) {
    return failure;
  }
  ctx.store_global(global);
  if (steward::schema::is_reserve_affecting(proposal.payload)) {
    health_monitor::assess(ctx, global, vault);
  }

  proposal.status = proposal_status_t::executed;
  proposal.executed_at = ctx.now();
  store_proposal(ctx, proposal);

  const auto type = steward::schema::policy_type_of(proposal.payload);
  spdlog::info("Proposal {} executed ({})", proposal.id,
               steward::schema::to_string(type));
  ctx.emit("proposal_executed",
           {{"proposal_id", std::to_string(proposal.id)},
            {"policy_type", std::string{steward::schema::to_string(type)}},
            {"executed_at", std::to_string(ctx.now())}});
  return std::nullopt;
}

tx_status_t cancel(execution_context& ctx,
                   const steward::schema::cancel_proposal_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  auto proposal = policy_proposal_t{};
  if (auto failure = load_proposal(ctx, request.proposal_id, proposal)) {
    return failure;
  }
  if (proposal.status != proposal_status_t::active) {
    return fail(transaction_error_code::proposal_not_active,
                "only active proposals can be cancelled");
  }
  if (ctx.now() >= proposal.voting_ends_at) {
    return fail(transaction_error_code::voting_closed,
                "voting window has ended");
  }

  proposal.status = proposal_status_t::cancelled;
  proposal.resolved_at = ctx.now();
  store_proposal(ctx, proposal);

  spdlog::info("Proposal {} cancelled", proposal.id);
  ctx.emit("proposal_cancelled",
           {{"proposal_id", std::to_string(proposal.id)},
            {"cancelled_at", std::to_string(ctx.now())}});
  return std::nullopt;
}

}  // namespace steward::execution::proposal_registry
