#include <steward/execution/circuit_breaker.hpp>
#include <steward/execution/math.hpp>

#include <spdlog/spdlog.h>

namespace steward::execution::circuit_breaker {

using steward::schema::transaction_error_code;

tx_status_t request(execution_context& ctx,
                    const steward::schema::request_circuit_breaker_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  if (!std::holds_alternative<steward::schema::breaker_idle_t>(
          global.circuit_breaker)) {
    return fail(transaction_error_code::circuit_breaker_not_idle,
                "circuit breaker already requested or active");
  }

  auto activatable_at =
      math::checked_add(ctx.now(), ctx.config().circuit_breaker_delay);
  if (!activatable_at) {
    return fail(transaction_error_code::arithmetic_overflow,
                "circuit breaker delay overflows");
  }

  global.circuit_breaker =
      steward::schema::breaker_requested_t{.requested_at = ctx.now()};
  ctx.store_global(global);

  spdlog::warn("Circuit breaker requested at {}: {}", ctx.now(),
               request.reason);
  ctx.emit("circuit_breaker",
           {{"phase", "requested"},
            {"requested_at", std::to_string(ctx.now())},
            {"activatable_at",
             std::to_string(*activatable_at)},
            {"reason", request.reason}});
  return std::nullopt;
}

tx_status_t activate(
    execution_context& ctx,
    const steward::schema::activate_circuit_breaker_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  const auto* pending =
      std::get_if<steward::schema::breaker_requested_t>(&global.circuit_breaker);
  if (pending == nullptr) {
    return fail(transaction_error_code::circuit_breaker_not_requested,
                "circuit breaker has not been requested");
  }
  auto activatable_at = math::checked_add(pending->requested_at,
                                          ctx.config().circuit_breaker_delay);
  if (!activatable_at) {
    return fail(transaction_error_code::arithmetic_overflow,
                "circuit breaker delay overflows");
  }
  if (ctx.now() < *activatable_at) {
    return fail(transaction_error_code::circuit_breaker_delay_not_elapsed,
                "circuit breaker delay has not elapsed; activatable at " +
                    std::to_string(*activatable_at));
  }

  const auto requested_at = pending->requested_at;
  global.circuit_breaker = steward::schema::breaker_active_t{
      .requested_at = requested_at, .activated_at = ctx.now()};
  ctx.store_global(global);

  spdlog::warn("Circuit breaker active since {} (requested {})", ctx.now(),
               requested_at);
  ctx.emit("circuit_breaker", {{"phase", "active"},
                               {"requested_at", std::to_string(requested_at)},
                               {"activated_at", std::to_string(ctx.now())}});
  return std::nullopt;
}

tx_status_t resume(execution_context& ctx,
                   const steward::schema::resume_operations_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (auto failure = require_authority(global, request.authority)) {
    return failure;
  }
  if (std::holds_alternative<steward::schema::breaker_idle_t>(
          global.circuit_breaker)) {
    return fail(transaction_error_code::circuit_breaker_not_engaged,
                "circuit breaker is idle");
  }

  const auto previous = steward::schema::phase_of(global.circuit_breaker);
  global.circuit_breaker =
      steward::schema::breaker_idle_t{.resumed_at = ctx.now()};
  ctx.store_global(global);

  spdlog::info("Operations resumed at {} (breaker was {})", ctx.now(),
               steward::schema::to_string(previous));
  ctx.emit("circuit_breaker",
           {{"phase", "idle"},
            {"previous_phase", std::string{steward::schema::to_string(previous)}},
            {"resumed_at", std::to_string(ctx.now())}});
  return std::nullopt;
}

tx_status_t require_operational(const steward::schema::global_state_t& global) {
  if (steward::schema::is_active(global.circuit_breaker)) {
    return fail(transaction_error_code::circuit_breaker_active,
                "circuit breaker is active");
  }
  return std::nullopt;
}

}  // namespace steward::execution::circuit_breaker
