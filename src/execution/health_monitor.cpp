#include <steward/execution/health_monitor.hpp>
#include <steward/execution/math.hpp>
#include <steward/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

namespace steward::execution::health_monitor {

using steward::schema::health_level_t;

namespace {

bool recommend_breaker_request(const health_level_t level,
                               const steward::schema::global_state_t& global) {
  return level == health_level_t::critical &&
         std::holds_alternative<steward::schema::breaker_idle_t>(
             global.circuit_breaker);
}

}  // namespace

health_level_t classify(
    const std::optional<uint64_t>& vhr_bps,
    const steward::schema::protocol_parameters_t& parameters) {
  if (!vhr_bps) {
    return health_level_t::healthy;
  }
  if (*vhr_bps < parameters.vhr_critical_bps) {
    return health_level_t::critical;
  }
  if (*vhr_bps < parameters.vhr_warning_bps) {
    return health_level_t::warning;
  }
  return health_level_t::healthy;
}

void assess(execution_context& ctx,
            const steward::schema::global_state_t& global,
            steward::schema::vault_state_t& vault) {
  auto oracle = ctx.load<steward::schema::oracle_state_t>(
      steward::schema::key::make_oracle_key(ctx.encoder()));

  // Without a price the reserve cannot be valued; the last level stands.
  const auto previous = vault.health;
  if (oracle) {
    vault.vhr_bps = math::vault_health_ratio_bps(
        vault.reserve_units, oracle->reading.index_value, vault.liabilities);
    vault.health = classify(vault.vhr_bps, global.parameters);
  } else if (vault.liabilities == 0) {
    vault.vhr_bps = std::nullopt;
    vault.health = health_level_t::healthy;
  }
  vault.last_assessed_at = ctx.now();
  ctx.store(steward::schema::key::make_vault_key(ctx.encoder()), vault);

  const auto recommended = recommend_breaker_request(vault.health, global);
  if (vault.health != previous) {
    if (vault.health == health_level_t::critical) {
      spdlog::warn("Vault health critical: vhr={} bps",
                   vault.vhr_bps.value_or(0));
    } else {
      spdlog::info("Vault health {} -> {}", steward::schema::to_string(previous),
                   steward::schema::to_string(vault.health));
    }
  }

  ctx.emit("vault_health",
           {{"vhr_bps", vault.vhr_bps ? std::to_string(*vault.vhr_bps)
                                      : std::string{"none"}},
            {"health", std::string{steward::schema::to_string(vault.health)}},
            {"previous_health",
             std::string{steward::schema::to_string(previous)}},
            {"breaker_request_recommended", recommended ? "true" : "false"}});
}

steward::schema::vault_health_report_t report(
    const steward::schema::global_state_t& global,
    const steward::schema::vault_state_t& vault,
    const steward::schema::timestamp_seconds_t now,
    const steward::schema::duration_seconds_t stale_after) {
  const auto stale = !global.last_oracle_update_at.has_value() ||
                     (now - *global.last_oracle_update_at) > stale_after;
  return steward::schema::vault_health_report_t{
      .vhr_bps = vault.vhr_bps,
      .health = vault.health,
      .breaker = steward::schema::phase_of(global.circuit_breaker),
      .oracle_stale = stale,
      .last_oracle_update_at = global.last_oracle_update_at,
      .breaker_request_recommended =
          recommend_breaker_request(vault.health, global)};
}

}  // namespace steward::execution::health_monitor
