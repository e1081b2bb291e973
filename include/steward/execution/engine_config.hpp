#pragma once

#include <steward/schema/primitives.hpp>
#include <optional>
#include <string>

namespace steward::execution {

/// Per-field admission bounds for oracle readings.
struct oracle_bounds_t final {
  uint64_t max_index_value{1'000'000'000'000};
  steward::schema::basis_points_t max_yield_bps{10'000};
  steward::schema::basis_points_t max_volatility_bps{10'000};
  uint64_t max_tvl_usd{1'000'000'000'000'000};
};

/// Runtime configuration of the engine. Every node of a network must run with
/// identical values; they feed deterministic execution.
struct engine_config final {
  std::string chain_name{"steward-local"};
  bool require_strict_crypto{true};
  steward::schema::duration_seconds_t execution_delay{172'800};
  steward::schema::duration_seconds_t circuit_breaker_delay{86'400};
  steward::schema::duration_seconds_t min_voting_period{3'600};
  steward::schema::duration_seconds_t max_voting_period{604'800};
  steward::schema::duration_seconds_t oracle_min_interval{300};
  uint64_t oracle_min_slot_buffer{100};
  steward::schema::duration_seconds_t oracle_stale_after{900};
  oracle_bounds_t oracle_bounds{};
};

/// Reason the configuration cannot drive the engine, if any. Delays and
/// intervals must be positive and the voting bounds must be ordered.
std::optional<std::string> validate_config(const engine_config& config);

}  // namespace steward::execution
