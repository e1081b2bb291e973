#include <steward/execution/protocol_state.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/vault_state.hpp>

#include <spdlog/spdlog.h>
#include <array>

namespace steward::execution::protocol_state {

using steward::schema::kBasisPointsDenominator;
using steward::schema::transaction_error_code;

tx_status_t validate_parameters(
    const steward::schema::protocol_parameters_t& parameters) {
  if (parameters.epoch_duration <= 0) {
    return fail(transaction_error_code::invalid_parameters,
                "epoch duration must be positive");
  }
  if (parameters.mint_burn_cap_bps > kBasisPointsDenominator) {
    return fail(transaction_error_code::invalid_parameters,
                "mint/burn cap exceeds 100%");
  }
  if (parameters.stability_fee_bps > kBasisPointsDenominator) {
    return fail(transaction_error_code::invalid_parameters,
                "stability fee exceeds 100%");
  }
  // Both thresholds sit at or above full collateralization.
  if (parameters.vhr_critical_bps < kBasisPointsDenominator ||
      parameters.vhr_warning_bps <= parameters.vhr_critical_bps) {
    return fail(transaction_error_code::invalid_parameters,
                "vhr thresholds require warning > critical >= 10000 bps");
  }
  return std::nullopt;
}

tx_status_t initialize(execution_context& ctx,
                       const steward::schema::initialize_protocol_t& request) {
  if (ctx.load_global()) {
    return fail(transaction_error_code::protocol_already_initialized,
                "protocol already initialized");
  }

  const auto references =
      std::array{request.authority, request.oracle, request.settlement_service,
                 request.reserve_vault, request.token_mint};
  for (const auto& reference : references) {
    if (steward::schema::is_zero(reference)) {
      return fail(transaction_error_code::invalid_reference,
                  "protocol references must be non-zero");
    }
  }
  if (request.reserve_vault == request.token_mint) {
    return fail(transaction_error_code::invalid_reference,
                "reserve vault and token mint must differ");
  }
  if (auto failure = validate_parameters(request.parameters)) {
    return failure;
  }

  ctx.store_global(steward::schema::global_state_t{
      .authority = request.authority,
      .oracle = request.oracle,
      .settlement_service = request.settlement_service,
      .reserve_vault = request.reserve_vault,
      .token_mint = request.token_mint,
      .parameters = request.parameters,
      .credit_rate_bps = 0,
      .proposal_counter = 0,
      .circuit_breaker = steward::schema::breaker_idle_t{},
      .last_oracle_update_at = std::nullopt,
      .last_oracle_update_slot = std::nullopt,
      .initialized_at = ctx.now()});
  ctx.store(steward::schema::key::make_vault_key(ctx.encoder()),
            steward::schema::vault_state_t{});

  spdlog::info("Protocol initialized by authority {}",
               to_hex(request.authority));
  ctx.emit("protocol_initialized",
           {{"authority", to_hex(request.authority)},
            {"reserve_vault", to_hex(request.reserve_vault)},
            {"token_mint", to_hex(request.token_mint)}});
  return std::nullopt;
}

tx_status_t update_parameters(
    execution_context& ctx,
    const steward::schema::update_parameters_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  if (auto failure = validate_parameters(request.parameters)) {
    return failure;
  }

  global.parameters = request.parameters;
  ctx.store_global(global);

  spdlog::info("Protocol parameters updated at height {}", ctx.height());
  ctx.emit("parameters_updated",
           {{"epoch_duration",
             std::to_string(request.parameters.epoch_duration)},
            {"mint_burn_cap_bps",
             std::to_string(request.parameters.mint_burn_cap_bps)},
            {"stability_fee_bps",
             std::to_string(request.parameters.stability_fee_bps)}});
  return std::nullopt;
}

}  // namespace steward::execution::protocol_state
