#include <steward/execution/circuit_breaker.hpp>
#include <steward/execution/health_monitor.hpp>
#include <steward/execution/math.hpp>
#include <steward/execution/reserve_custody.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/vault_state.hpp>

#include <spdlog/spdlog.h>

namespace steward::execution::reserve_custody {

using steward::schema::transaction_error_code;

namespace {

steward::schema::vault_state_t load_vault(execution_context& ctx) {
  return ctx
      .load<steward::schema::vault_state_t>(
          steward::schema::key::make_vault_key(ctx.encoder()))
      .value_or(steward::schema::vault_state_t{});
}

}  // namespace

tx_status_t deposit(execution_context& ctx,
                    const steward::schema::deposit_reserve_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  if (request.amount == 0) {
    return fail(transaction_error_code::invalid_amount,
                "deposit amount must be positive");
  }

  auto vault = load_vault(ctx);
  auto updated = math::checked_add(vault.reserve_units, request.amount);
  if (!updated) {
    return fail(transaction_error_code::arithmetic_overflow,
                "reserve balance overflows");
  }
  vault.reserve_units = *updated;

  spdlog::info("Reserve deposit of {} units", request.amount.str());
  ctx.emit("reserve_deposit", {{"amount", request.amount.str()},
                               {"reserve_units", vault.reserve_units.str()}});
  health_monitor::assess(ctx, global, vault);
  return std::nullopt;
}

tx_status_t withdraw(execution_context& ctx,
                     const steward::schema::withdraw_reserve_t& request) {
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
  if (request.amount == 0) {
    return fail(transaction_error_code::invalid_amount,
                "withdrawal amount must be positive");
  }

  auto vault = load_vault(ctx);
  auto updated = math::checked_sub(vault.reserve_units, request.amount);
  if (!updated) {
    return fail(transaction_error_code::insufficient_reserve,
                "withdrawal exceeds reserve balance");
  }
  vault.reserve_units = *updated;

  spdlog::info("Reserve withdrawal of {} units", request.amount.str());
  ctx.emit("reserve_withdrawal", {{"amount", request.amount.str()},
                                  {"reserve_units", vault.reserve_units.str()}});
  health_monitor::assess(ctx, global, vault);
  return std::nullopt;
}

}  // namespace steward::execution::reserve_custody
