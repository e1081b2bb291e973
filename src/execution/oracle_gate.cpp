#include <steward/execution/health_monitor.hpp>
#include <steward/execution/oracle_gate.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/oracle_state.hpp>
#include <steward/schema/vault_state.hpp>

#include <spdlog/spdlog.h>

namespace steward::execution::oracle_gate {

using steward::schema::transaction_error_code;

namespace {

tx_status_t out_of_bounds(const std::string_view field) {
  return fail(transaction_error_code::oracle_value_out_of_bounds,
              std::string{field} + " out of bounds");
}

}  // namespace

tx_status_t validate_reading(const steward::schema::oracle_reading_t& reading,
                             const oracle_bounds_t& bounds) {
  if (reading.index_value == 0 || reading.index_value > bounds.max_index_value) {
    return out_of_bounds("index_value");
  }
  if (reading.avg_yield_bps > bounds.max_yield_bps) {
    return out_of_bounds("avg_yield_bps");
  }
  if (reading.volatility_bps > bounds.max_volatility_bps) {
    return out_of_bounds("volatility_bps");
  }
  if (reading.tvl_usd == 0 || reading.tvl_usd > bounds.max_tvl_usd) {
    return out_of_bounds("tvl_usd");
  }
  return std::nullopt;
}

tx_status_t update(execution_context& ctx,
                   const steward::schema::update_oracle_t& request) {
  auto global = steward::schema::global_state_t{};
  if (auto failure = require_global(ctx, global)) {
    return failure;
  }
  if (request.reporter != global.oracle) {
    return fail(transaction_error_code::unauthorized,
                "reporter is not the configured oracle");
  }
  const auto& reading = request.reading;
  if (auto failure = validate_reading(reading, ctx.config().oracle_bounds)) {
    return failure;
  }
  if (reading.observed_at > ctx.now() || reading.observed_slot > ctx.height()) {
    return fail(transaction_error_code::oracle_reading_in_future,
                "reading observed after the executing block");
  }

  // Time and slot spacing are both required; a large slot delta does not
  // excuse a short interval or the reverse.
  if (global.last_oracle_update_at &&
      ctx.now() - *global.last_oracle_update_at <
          ctx.config().oracle_min_interval) {
    return fail(transaction_error_code::oracle_update_too_soon,
                "last update at " +
                    std::to_string(*global.last_oracle_update_at) +
                    "; minimum interval " +
                    std::to_string(ctx.config().oracle_min_interval) + "s");
  }
  if (global.last_oracle_update_slot &&
      ctx.height() - *global.last_oracle_update_slot <
          ctx.config().oracle_min_slot_buffer) {
    return fail(transaction_error_code::oracle_slot_buffer_not_met,
                "next update allowed at slot " +
                    std::to_string(*global.last_oracle_update_slot +
                                   ctx.config().oracle_min_slot_buffer));
  }

  auto oracle_key = steward::schema::key::make_oracle_key(ctx.encoder());
  auto oracle = ctx.load<steward::schema::oracle_state_t>(oracle_key).value_or(
      steward::schema::oracle_state_t{});
  oracle.reading = reading;
  oracle.accepted_at = ctx.now();
  oracle.accepted_slot = ctx.height();
  ++oracle.update_count;
  ctx.store(std::move(oracle_key), oracle);

  global.last_oracle_update_at = ctx.now();
  global.last_oracle_update_slot = ctx.height();
  ctx.store_global(global);

  spdlog::info("Oracle reading {} admitted at slot {}: index={} tvl={}",
               oracle.update_count, ctx.height(), reading.index_value,
               reading.tvl_usd);
  ctx.emit("oracle_updated",
           {{"index_value", std::to_string(reading.index_value)},
            {"avg_yield_bps", std::to_string(reading.avg_yield_bps)},
            {"volatility_bps", std::to_string(reading.volatility_bps)},
            {"tvl_usd", std::to_string(reading.tvl_usd)},
            {"slot", std::to_string(ctx.height())}});

  auto vault = ctx.load<steward::schema::vault_state_t>(
                      steward::schema::key::make_vault_key(ctx.encoder()))
                   .value_or(steward::schema::vault_state_t{});
  health_monitor::assess(ctx, global, vault);
  return std::nullopt;
}

}  // namespace steward::execution::oracle_gate
